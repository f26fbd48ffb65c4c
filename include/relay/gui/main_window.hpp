// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/source_reader.hpp>
#include <relay/guide/associator.hpp>
#include <relay/session/session.hpp>
#include <relay/session/source_loader.hpp>
#include <relay/store/library_store.hpp>
#include <QMainWindow>
#include <memory>

class QComboBox;
class QLabel;
class QLineEdit;
class QMenu;
class QListWidget;
class QListWidgetItem;
class QPushButton;
class QTimer;

namespace relay::gui {

class EpgPanel;
class SourceDialog;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

    // Start loading a playlist / guide in the background
    void open_playlist(const QString& source);
    void open_epg(const QString& source);

protected:
    void closeEvent(QCloseEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;

private slots:
    void on_open_playlist();
    void on_load_epg();
    void on_reload();
    void on_save_playlist();
    void on_toggle_favorite();
    void on_play();
    void on_about();
    void on_category_changed();
    void on_channel_selected();

private:
    void setup_ui();
    void setup_menu_bar();
    void setup_toolbar();
    void setup_status_bar();
    void connect_signals();
    void apply_theme();

    // Runs on the GUI thread
    void handle_outcome(const session::ReloadOutcome& outcome);

    void rebuild_categories();
    void refresh_channel_list();
    void refresh_epg_panel();
    void update_status();

    void restore_sources();
    void save_library();
    void rebuild_saved_menu();

    [[nodiscard]] const model::Channel* selected_channel() const;

    session::ReloadCallback marshal_to_gui();

    // Core
    session::Session session_;
    core::DefaultSourceReader reader_;
    guide::Associator associator_;
    store::LibraryStore library_;
    std::unique_ptr<session::SourceLoader> loader_;
    std::shared_ptr<const session::Dataset> dataset_;

    bool epg_requested_{false};
    bool epg_hint_offered_{false};

    // False when an unreadable library could not be moved aside
    bool library_writable_{true};

    // UI Components
    QComboBox* combo_category_{nullptr};
    QLineEdit* edit_search_{nullptr};
    QListWidget* channel_list_{nullptr};
    EpgPanel* epg_panel_{nullptr};
    QTimer* search_timer_{nullptr};
    QMenu* saved_menu_{nullptr};

    // Action buttons
    QPushButton* btn_open_{nullptr};
    QPushButton* btn_epg_{nullptr};
    QPushButton* btn_reload_{nullptr};
    QPushButton* btn_favorite_{nullptr};
    QPushButton* btn_play_{nullptr};

    // Status bar
    QLabel* status_channels_{nullptr};
    QLabel* status_guide_{nullptr};
    QLabel* status_reload_{nullptr};

    // Dialogs
    std::unique_ptr<SourceDialog> playlist_dialog_;
    std::unique_ptr<SourceDialog> epg_dialog_;
};

} // namespace relay::gui
