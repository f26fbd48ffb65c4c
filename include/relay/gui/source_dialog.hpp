// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <QDialog>
#include <QString>

class QLabel;
class QLineEdit;
class QPushButton;

namespace relay::gui {

// Asks for a playlist or guide location: a local file or an http(s) URL
class SourceDialog : public QDialog {
    Q_OBJECT

public:
    enum class Kind {
        playlist,
        epg,
    };

    explicit SourceDialog(Kind kind, QWidget* parent = nullptr);
    ~SourceDialog() override;

    [[nodiscard]] QString source() const;

    // Prefill (last used source or a playlist's guide hint)
    void set_source(const QString& source);

protected:
    void showEvent(QShowEvent* event) override;

private:
    void setup_ui();
    void validate_source();

    Kind kind_;
    QLineEdit* edit_source_{nullptr};
    QPushButton* btn_browse_{nullptr};
    QPushButton* btn_ok_{nullptr};
    QPushButton* btn_cancel_{nullptr};
    QLabel* label_info_{nullptr};
};

} // namespace relay::gui
