// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/gui/main_window.hpp>
#include <relay/gui/epg_panel.hpp>
#include <relay/gui/source_dialog.hpp>
#include <relay/core/config.hpp>
#include <relay/core/http_client.hpp>
#include <relay/core/log.hpp>
#include <relay/core/source.hpp>
#include <relay/media/m3u_parser.hpp>
#include <relay/media/xmltv_parser.hpp>
#include <relay/version.hpp>

#include <QAction>
#include <QCloseEvent>
#include <QComboBox>
#include <QDesktopServices>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QHBoxLayout>
#include <QInputDialog>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QListWidgetItem>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QPushButton>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>
#include <QTimer>
#include <QToolBar>
#include <QUrl>
#include <QVBoxLayout>
#include <chrono>

namespace relay::gui {

namespace {

constexpr int INDEX_ALL = 0;
constexpr int INDEX_FAVORITES = 1;

QString modern_button_style() {
    return R"(
        QPushButton {
            background-color: #3a3a3a;
            border: 1px solid #555;
            border-radius: 4px;
            padding: 6px 16px;
            color: #eee;
            font-weight: 500;
        }
        QPushButton:hover {
            background-color: #4a4a4a;
            border-color: #666;
        }
        QPushButton:pressed {
            background-color: #2a2a2a;
        }
        QPushButton:disabled {
            background-color: #2a2a2a;
            color: #666;
            border-color: #333;
        }
    )";
}

QString modern_list_style() {
    return R"(
        QListWidget {
            background-color: #2a2a2a;
            border: none;
            outline: none;
        }
        QListWidget::item {
            padding: 8px;
            border-bottom: 1px solid #3a3a3a;
        }
        QListWidget::item:selected {
            background-color: #2a5a8a;
            color: #fff;
        }
        QListWidget::item:hover {
            background-color: #333;
        }
    )";
}

QString input_style() {
    return R"(
        QLineEdit, QComboBox {
            background-color: #2a2a2a;
            border: 1px solid #444;
            border-radius: 4px;
            padding: 6px;
            color: #ccc;
        }
        QLineEdit:focus {
            border-color: #0078d4;
        }
    )";
}

model::Instant now() {
    return std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
}

} // namespace

//=============================================================================
// MainWindow
//=============================================================================

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent) {

    core::HttpClient::global_init();

    auto store_path = store::LibraryStore::default_path();
    auto opened = store::LibraryStore::open(store_path);
    QString library_warning;
    if (opened) {
        library_ = std::move(*opened);
    } else {
        // Never save over a library that could not be read
        library_ = store::LibraryStore(store_path);
        if (auto moved = store::LibraryStore::set_aside(store_path)) {
            library_warning = QString("The library file could not be read and was kept as:\n%1\n\n"
                                      "Starting with an empty library.")
                                  .arg(QString::fromStdString(*moved));
        } else {
            library_writable_ = false;
            library_warning = QString("The library file %1 could not be read.\n\n"
                                      "Favorites and settings changed in this session will not be saved.")
                                  .arg(QString::fromStdString(store_path));
        }
    }

    loader_ = std::make_unique<session::SourceLoader>(session_, reader_);
    dataset_ = session_.snapshot();

    setWindowTitle(QString("%1 %2").arg(QString::fromUtf8(APP_NAME.data(), APP_NAME.size()))
                                   .arg(relay::version.to_string().c_str()));
    resize(1100, 700);
    setAcceptDrops(true);

    apply_theme();
    setup_ui();
    setup_menu_bar();
    setup_toolbar();
    setup_status_bar();
    connect_signals();

    QSettings settings(QString::fromUtf8(ORGANIZATION.data(), ORGANIZATION.size()), "RelayIPTV");
    restoreGeometry(settings.value("geometry").toByteArray());

    // Keep "now playing" current
    auto* refresh_timer = new QTimer(this);
    connect(refresh_timer, &QTimer::timeout, this, &MainWindow::refresh_epg_panel);
    refresh_timer->start(std::chrono::duration_cast<std::chrono::milliseconds>(core::EPG_REFRESH_INTERVAL));

    update_status();
    restore_sources();

    if (!library_warning.isEmpty()) {
        QTimer::singleShot(0, this, [this, library_warning]() {
            QMessageBox::warning(this, "Library", library_warning);
        });
    }
}

MainWindow::~MainWindow() {
    // Join workers before anything they report to goes away
    loader_.reset();
    save_library();
    core::HttpClient::global_cleanup();
}

void MainWindow::setup_ui() {
    auto* central = new QWidget(this);
    setCentralWidget(central);

    auto* main_layout = new QHBoxLayout(central);
    main_layout->setContentsMargins(0, 0, 0, 0);

    auto* splitter = new QSplitter(Qt::Horizontal, this);

    // Left side: category, search, channel list
    auto* left = new QWidget(this);
    auto* left_layout = new QVBoxLayout(left);
    left_layout->setContentsMargins(8, 8, 8, 8);

    combo_category_ = new QComboBox(this);
    combo_category_->setStyleSheet(input_style());
    left_layout->addWidget(combo_category_);

    edit_search_ = new QLineEdit(this);
    edit_search_->setPlaceholderText("Search channels");
    edit_search_->setClearButtonEnabled(true);
    edit_search_->setStyleSheet(input_style());
    left_layout->addWidget(edit_search_);

    channel_list_ = new QListWidget(this);
    channel_list_->setMinimumWidth(280);
    channel_list_->setStyleSheet(modern_list_style());
    left_layout->addWidget(channel_list_, 1);

    splitter->addWidget(left);

    // Right side: program details
    epg_panel_ = new EpgPanel(this);
    splitter->addWidget(epg_panel_);

    splitter->setStretchFactor(0, 0);
    splitter->setStretchFactor(1, 1);
    splitter->setSizes({350, 750});

    main_layout->addWidget(splitter);

    search_timer_ = new QTimer(this);
    search_timer_->setSingleShot(true);
    search_timer_->setInterval(core::SEARCH_DEBOUNCE);

    rebuild_categories();
}

void MainWindow::setup_menu_bar() {
    auto* file_menu = menuBar()->addMenu("&File");

    auto* open_action = file_menu->addAction("&Open Playlist...");
    open_action->setShortcut(QKeySequence::Open);
    connect(open_action, &QAction::triggered, this, &MainWindow::on_open_playlist);

    auto* epg_action = file_menu->addAction("Load &Guide...");
    epg_action->setShortcut(QKeySequence("Ctrl+G"));
    connect(epg_action, &QAction::triggered, this, &MainWindow::on_load_epg);

    auto* reload_action = file_menu->addAction("&Reload");
    reload_action->setShortcut(QKeySequence::Refresh);
    connect(reload_action, &QAction::triggered, this, &MainWindow::on_reload);

    file_menu->addSeparator();

    saved_menu_ = file_menu->addMenu("&Saved Playlists");

    auto* save_playlist_action = file_menu->addAction("Sa&ve Playlist As...");
    connect(save_playlist_action, &QAction::triggered, this, &MainWindow::on_save_playlist);
    rebuild_saved_menu();

    file_menu->addSeparator();

    auto* exit_action = file_menu->addAction("E&xit");
    exit_action->setShortcut(QKeySequence::Quit);
    connect(exit_action, &QAction::triggered, this, &MainWindow::close);

    auto* channel_menu = menuBar()->addMenu("&Channel");

    auto* play_action = channel_menu->addAction("&Play");
    play_action->setShortcut(QKeySequence("Ctrl+P"));
    connect(play_action, &QAction::triggered, this, &MainWindow::on_play);

    auto* fav_action = channel_menu->addAction("Toggle &Favorite");
    fav_action->setShortcut(QKeySequence("Ctrl+D"));
    connect(fav_action, &QAction::triggered, this, &MainWindow::on_toggle_favorite);

    auto* help_menu = menuBar()->addMenu("&Help");
    auto* about_action = help_menu->addAction("&About...");
    connect(about_action, &QAction::triggered, this, &MainWindow::on_about);
}

void MainWindow::setup_toolbar() {
    auto* toolbar = addToolBar("Main");
    toolbar->setMovable(false);
    toolbar->setStyleSheet(R"(
        QToolBar {
            background-color: #2a2a2a;
            border: none;
            spacing: 4px;
            padding: 4px;
        }
        QToolBar::separator {
            width: 16px;
            background-color: #3a3a3a;
        }
    )");

    btn_open_ = new QPushButton("Open Playlist", this);
    btn_open_->setStyleSheet(modern_button_style());
    connect(btn_open_, &QPushButton::clicked, this, &MainWindow::on_open_playlist);
    toolbar->addWidget(btn_open_);

    btn_epg_ = new QPushButton("Load Guide", this);
    btn_epg_->setStyleSheet(modern_button_style());
    connect(btn_epg_, &QPushButton::clicked, this, &MainWindow::on_load_epg);
    toolbar->addWidget(btn_epg_);

    btn_reload_ = new QPushButton("Reload", this);
    btn_reload_->setStyleSheet(modern_button_style());
    btn_reload_->setEnabled(false);
    connect(btn_reload_, &QPushButton::clicked, this, &MainWindow::on_reload);
    toolbar->addWidget(btn_reload_);

    toolbar->addSeparator();

    btn_favorite_ = new QPushButton("Favorite", this);
    btn_favorite_->setStyleSheet(modern_button_style());
    btn_favorite_->setEnabled(false);
    connect(btn_favorite_, &QPushButton::clicked, this, &MainWindow::on_toggle_favorite);
    toolbar->addWidget(btn_favorite_);

    btn_play_ = new QPushButton("Play", this);
    btn_play_->setStyleSheet(modern_button_style());
    btn_play_->setEnabled(false);
    connect(btn_play_, &QPushButton::clicked, this, &MainWindow::on_play);
    toolbar->addWidget(btn_play_);
}

void MainWindow::setup_status_bar() {
    status_channels_ = new QLabel("Channels: 0", this);
    status_guide_ = new QLabel("Guide: none", this);
    status_reload_ = new QLabel(this);

    statusBar()->setStyleSheet(R"(
        QStatusBar {
            background-color: #2a2a2a;
            color: #ccc;
            border-top: 1px solid #3a3a3a;
        }
    )");

    statusBar()->addWidget(status_reload_, 1);
    statusBar()->addPermanentWidget(status_channels_);
    statusBar()->addPermanentWidget(status_guide_);
}

void MainWindow::connect_signals() {
    connect(channel_list_, &QListWidget::itemSelectionChanged, this, &MainWindow::on_channel_selected);
    connect(channel_list_, &QListWidget::itemDoubleClicked, this, [this](QListWidgetItem*) { on_play(); });

    connect(combo_category_, &QComboBox::currentIndexChanged, this, &MainWindow::on_category_changed);

    // Filter only once typing pauses
    connect(edit_search_, &QLineEdit::textChanged, search_timer_, qOverload<>(&QTimer::start));
    connect(search_timer_, &QTimer::timeout, this, &MainWindow::refresh_channel_list);
}

void MainWindow::apply_theme() {
    setStyleSheet(R"(
        QMainWindow {
            background-color: #1e1e1e;
            color: #ccc;
        }
        QWidget {
            background-color: #1e1e1e;
            color: #ccc;
        }
        QMenuBar {
            background-color: #2a2a2a;
            color: #ccc;
            border-bottom: 1px solid #3a3a3a;
        }
        QMenuBar::item:selected {
            background-color: #3a3a3a;
        }
        QMenu {
            background-color: #2a2a2a;
            color: #ccc;
            border: 1px solid #3a3a3a;
        }
        QMenu::item:selected {
            background-color: #3a3a3a;
        }
    )");
}

//=============================================================================
// Loading
//=============================================================================

session::ReloadCallback MainWindow::marshal_to_gui() {
    return [this](const session::ReloadOutcome& outcome) {
        QMetaObject::invokeMethod(this, [this, outcome]() { handle_outcome(outcome); },
                                  Qt::QueuedConnection);
    };
}

void MainWindow::open_playlist(const QString& source) {
    if (source.isEmpty()) return;

    status_reload_->setText(QString("Loading playlist %1...").arg(source));
    loader_->reload_playlist(source.toStdString(), marshal_to_gui());
}

void MainWindow::open_epg(const QString& source) {
    if (source.isEmpty()) return;

    epg_requested_ = true;
    status_reload_->setText(QString("Loading guide %1...").arg(source));
    loader_->reload_epg(source.toStdString(), marshal_to_gui());
}

void MainWindow::handle_outcome(const session::ReloadOutcome& outcome) {
    bool is_playlist = outcome.target == session::ReloadTarget::playlist;
    QString what = is_playlist ? "Playlist" : "Guide";

    if (outcome.status == session::ReloadStatus::superseded) {
        return;
    }

    if (outcome.status == session::ReloadStatus::failed) {
        QString reason = outcome.failure
            ? QString::fromStdString(outcome.failure->describe())
            : QString("Unknown error");
        status_reload_->setText(QString("%1 failed to load").arg(what));
        QMessageBox::warning(this, QString("%1 Error").arg(what),
            QString("Could not load %1:\n%2")
                .arg(QString::fromStdString(outcome.source))
                .arg(reason));
        return;
    }

    dataset_ = session_.snapshot();
    btn_reload_->setEnabled(true);
    bool remote = false;
    if (auto ref = core::SourceRef::parse(outcome.source)) {
        remote = ref->is_remote();
    }

    if (is_playlist) {
        library_.set_setting(core::SETTING_LAST_PLAYLIST, outcome.source);
        library_.set_setting(core::SETTING_LAST_PLAYLIST_IS_URL, remote ? "1" : "0");
        rebuild_categories();
        refresh_channel_list();
    } else {
        library_.set_setting(core::SETTING_LAST_EPG, outcome.source);
        if (remote) {
            library_.set_setting(core::SETTING_EPG_URL, outcome.source);
        }
        refresh_epg_panel();
    }
    save_library();
    update_status();

    QString message = QString("%1 loaded: %2 %3").arg(what).arg(outcome.item_count)
                          .arg(is_playlist ? "channels" : "programs");
    if (outcome.skipped_entries > 0) {
        message += QString(", %1 malformed entries skipped").arg(outcome.skipped_entries);
    }
    status_reload_->setText(message);

    // Offer the guide the playlist header advertises
    auto hint = dataset_->playlist->epg_url();
    if (is_playlist && !epg_requested_ && !epg_hint_offered_ && !hint.empty()) {
        epg_hint_offered_ = true;
        auto answer = QMessageBox::question(this, "Program Guide",
            QString("The playlist names a program guide:\n%1\n\nLoad it now?")
                .arg(QString::fromStdString(hint)));
        if (answer == QMessageBox::Yes) {
            open_epg(QString::fromStdString(hint));
        }
    }
}

void MainWindow::restore_sources() {
    auto playlist = library_.setting(core::SETTING_LAST_PLAYLIST);
    auto epg = library_.setting(core::SETTING_LAST_EPG);

    if (!playlist.empty()) {
        open_playlist(QString::fromStdString(playlist));
    }
    if (!epg.empty()) {
        open_epg(QString::fromStdString(epg));
    }
}

void MainWindow::save_library() {
    if (!library_writable_) {
        core::logger()->debug("Library {} is read-only for this session", library_.path());
        return;
    }
    if (auto ec = library_.save()) {
        core::logger()->error("Saving library failed: {}", ec.message());
        statusBar()->showMessage(QString("Could not save library: %1").arg(ec.message().c_str()), 5000);
    }
}

void MainWindow::rebuild_saved_menu() {
    saved_menu_->clear();

    const auto& saved = library_.playlists();
    if (saved.empty()) {
        saved_menu_->addAction("(none)")->setEnabled(false);
        return;
    }

    for (const auto& entry : saved) {
        auto source = QString::fromStdString(entry.path);
        auto* action = saved_menu_->addAction(QString::fromStdString(entry.name));
        action->setToolTip(source);
        connect(action, &QAction::triggered, this, [this, source]() { open_playlist(source); });
    }

    saved_menu_->addSeparator();
    auto* remove_menu = saved_menu_->addMenu("&Remove");
    for (const auto& entry : saved) {
        auto name = entry.name;
        auto* action = remove_menu->addAction(QString::fromStdString(name));
        connect(action, &QAction::triggered, this, [this, name]() {
            if (library_.remove_playlist(name)) {
                save_library();
                rebuild_saved_menu();
            }
        });
    }
}

//=============================================================================
// Channel list
//=============================================================================

void MainWindow::rebuild_categories() {
    QString current = combo_category_->currentText();

    combo_category_->blockSignals(true);
    combo_category_->clear();
    combo_category_->addItem("All channels");
    combo_category_->addItem("Favorites");
    if (dataset_) {
        for (const auto& group : dataset_->playlist->categories()) {
            combo_category_->addItem(QString::fromStdString(group));
        }
    }

    int index = combo_category_->findText(current);
    combo_category_->setCurrentIndex(index >= 0 ? index : INDEX_ALL);
    combo_category_->blockSignals(false);
}

void MainWindow::refresh_channel_list() {
    QString selected;
    if (auto* item = channel_list_->currentItem()) {
        selected = item->data(Qt::UserRole).toString();
    }

    channel_list_->clear();
    if (!dataset_) return;

    const auto& playlist = *dataset_->playlist;
    int index = combo_category_->currentIndex();

    std::vector<const model::Channel*> channels;
    if (index == INDEX_FAVORITES) {
        channels = library_.resolve(playlist);
    } else if (index > INDEX_FAVORITES) {
        channels = playlist.channels_in(combo_category_->currentText().toStdString());
    } else {
        channels = playlist.search({});
    }

    QString query = edit_search_->text().trimmed();
    for (const auto* channel : channels) {
        auto name = QString::fromStdString(channel->name);
        if (!query.isEmpty() && !name.contains(query, Qt::CaseInsensitive)) {
            continue;
        }

        auto* item = new QListWidgetItem();
        item->setText(library_.is_favorite(*channel) ? QString::fromUtf8("★ ") + name : name);
        item->setData(Qt::UserRole, QString::fromStdString(channel->identifier));
        channel_list_->addItem(item);

        if (!selected.isEmpty() && item->data(Qt::UserRole).toString() == selected) {
            channel_list_->setCurrentItem(item);
        }
    }

    update_status();
}

const model::Channel* MainWindow::selected_channel() const {
    auto* item = channel_list_->currentItem();
    if (!item || !dataset_) return nullptr;
    return dataset_->playlist->find(item->data(Qt::UserRole).toString().toStdString());
}

void MainWindow::refresh_epg_panel() {
    const auto* channel = selected_channel();
    if (!channel) {
        epg_panel_->clear();
        return;
    }

    auto t = now();
    auto info = associator_.now_next(*dataset_, *channel, t);
    auto upcoming = associator_.upcoming(*dataset_, *channel, t, core::UPCOMING_PROGRAMS + 1);
    epg_panel_->show_channel(*channel, info, upcoming, t);
}

void MainWindow::update_status() {
    std::size_t channels = dataset_ ? dataset_->playlist->size() : 0;
    status_channels_->setText(QString("Channels: %1 shown / %2").arg(channel_list_->count()).arg(channels));

    if (dataset_ && dataset_->guide->channel_count() > 0) {
        status_guide_->setText(QString("Guide: %1 channels, %2 programs")
            .arg(dataset_->guide->channel_count())
            .arg(dataset_->guide->program_count()));
    } else {
        status_guide_->setText("Guide: none");
    }
}

//=============================================================================
// Slots
//=============================================================================

void MainWindow::on_open_playlist() {
    if (!playlist_dialog_) {
        playlist_dialog_ = std::make_unique<SourceDialog>(SourceDialog::Kind::playlist, this);
    }
    playlist_dialog_->set_source(dataset_ ? QString::fromStdString(dataset_->playlist_source) : QString());

    if (playlist_dialog_->exec() == QDialog::Accepted) {
        open_playlist(playlist_dialog_->source());
    }
}

void MainWindow::on_load_epg() {
    if (!epg_dialog_) {
        epg_dialog_ = std::make_unique<SourceDialog>(SourceDialog::Kind::epg, this);
    }

    QString prefill = dataset_ ? QString::fromStdString(dataset_->epg_source) : QString();
    if (prefill.isEmpty() && dataset_) {
        prefill = QString::fromStdString(dataset_->playlist->epg_url());
    }
    if (prefill.isEmpty()) {
        prefill = QString::fromStdString(library_.setting(core::SETTING_EPG_URL));
    }
    epg_dialog_->set_source(prefill);

    if (epg_dialog_->exec() == QDialog::Accepted) {
        open_epg(epg_dialog_->source());
    }
}

void MainWindow::on_reload() {
    if (!dataset_) return;

    // Reload what is on screen, not a source that failed to load
    open_playlist(QString::fromStdString(dataset_->playlist_source));
    open_epg(QString::fromStdString(dataset_->epg_source));
}

void MainWindow::on_save_playlist() {
    if (!dataset_ || dataset_->playlist_source.empty()) {
        QMessageBox::information(this, "Save Playlist", "Load a playlist first.");
        return;
    }

    auto ref = core::SourceRef::parse(dataset_->playlist_source);
    if (!ref) {
        core::logger()->warn("Cannot save playlist source {}: {}", dataset_->playlist_source, ref.error().message());
        return;
    }

    bool ok = false;
    auto name = QInputDialog::getText(this, "Save Playlist", "Name:", QLineEdit::Normal,
                                      QString::fromStdString(ref->filename()), &ok).trimmed();
    if (!ok || name.isEmpty()) return;

    library_.add_playlist(store::SavedPlaylist{name.toStdString(), dataset_->playlist_source, ref->is_remote()});
    save_library();
    rebuild_saved_menu();
    status_reload_->setText(QString("Saved playlist %1").arg(name));
}

void MainWindow::on_toggle_favorite() {
    const auto* channel = selected_channel();
    if (!channel) return;

    if (library_.is_favorite(*channel)) {
        // Favorites from an older playlist may only match by URL
        std::vector<std::string> stale;
        for (const auto& favorite : library_.favorites()) {
            if (favorite.identifier == channel->identifier || favorite.url == channel->url) {
                stale.push_back(favorite.identifier);
            }
        }
        for (const auto& identifier : stale) {
            library_.remove_favorite(identifier);
        }
    } else {
        library_.add_favorite(store::Favorite::from_channel(*channel));
    }

    save_library();
    refresh_channel_list();
}

void MainWindow::on_play() {
    const auto* channel = selected_channel();
    if (!channel) return;

    core::logger()->info("Playing '{}' ({})", channel->name, channel->url);
    if (!QDesktopServices::openUrl(QUrl(QString::fromStdString(channel->url)))) {
        QMessageBox::warning(this, "Playback",
            QString("No media player accepted the stream:\n%1").arg(QString::fromStdString(channel->url)));
    }
}

void MainWindow::on_about() {
    QMessageBox::about(this, "About Relay IPTV",
        QString("<h3>Relay IPTV %1</h3>"
                "<p>M3U playlists with XMLTV program guides.</p>"
                "<p>Created by changcheng967</p>"
                "<p>Built with C++23, Qt 6, libcurl</p>")
            .arg(relay::version.to_string().c_str()));
}

void MainWindow::on_category_changed() {
    refresh_channel_list();
}

void MainWindow::on_channel_selected() {
    bool has_selection = selected_channel() != nullptr;
    btn_play_->setEnabled(has_selection);
    btn_favorite_->setEnabled(has_selection);
    refresh_epg_panel();
}

//=============================================================================
// Window events
//=============================================================================

void MainWindow::closeEvent(QCloseEvent* event) {
    QSettings settings(QString::fromUtf8(ORGANIZATION.data(), ORGANIZATION.size()), "RelayIPTV");
    settings.setValue("geometry", saveGeometry());
    event->accept();
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event) {
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    }
}

void MainWindow::dropEvent(QDropEvent* event) {
    const auto urls = event->mimeData()->urls();
    for (const auto& url : urls) {
        QString source = url.isLocalFile() ? url.toLocalFile() : url.toString();
        auto text = source.toStdString();

        if (media::XmltvParser::is_epg_path(text)) {
            open_epg(source);
        } else if (media::M3UParser::is_playlist_path(text)) {
            open_playlist(source);
        }
    }
}

} // namespace relay::gui
