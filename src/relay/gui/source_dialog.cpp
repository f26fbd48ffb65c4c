// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/gui/source_dialog.hpp>
#include <relay/core/source.hpp>
#include <relay/media/m3u_parser.hpp>
#include <relay/media/xmltv_parser.hpp>
#include <QDir>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

namespace relay::gui {

SourceDialog::SourceDialog(Kind kind, QWidget* parent)
    : QDialog(parent)
    , kind_(kind) {

    setWindowTitle(kind_ == Kind::playlist ? "Open Playlist" : "Load Program Guide");
    setMinimumWidth(500);
    setup_ui();
}

SourceDialog::~SourceDialog() = default;

void SourceDialog::setup_ui() {
    auto* layout = new QVBoxLayout(this);
    auto* form_layout = new QFormLayout();

    auto* source_layout = new QHBoxLayout();
    edit_source_ = new QLineEdit(this);
    edit_source_->setPlaceholderText(kind_ == Kind::playlist
        ? "https://example.com/playlist.m3u or a local file"
        : "https://example.com/guide.xml or a local file");
    edit_source_->setStyleSheet(R"(
        QLineEdit {
            background-color: #2a2a2a;
            border: 1px solid #444;
            border-radius: 4px;
            padding: 8px;
            color: #ccc;
        }
        QLineEdit:focus {
            border-color: #0078d4;
        }
    )");
    connect(edit_source_, &QLineEdit::textChanged, this, &SourceDialog::validate_source);
    source_layout->addWidget(edit_source_);

    btn_browse_ = new QPushButton("Browse...", this);
    btn_browse_->setStyleSheet(R"(
        QPushButton {
            background-color: #3a3a3a;
            border: 1px solid #555;
            border-radius: 4px;
            padding: 6px 16px;
            color: #eee;
        }
        QPushButton:hover { background-color: #4a4a4a; }
    )");
    connect(btn_browse_, &QPushButton::clicked, this, [this]() {
        QString filter = kind_ == Kind::playlist
            ? "Playlists (*.m3u *.m3u8);;All files (*)"
            : "XMLTV guides (*.xml *.xmltv);;All files (*)";
        QString path = QFileDialog::getOpenFileName(this, windowTitle(), QDir::homePath(), filter);
        if (!path.isEmpty()) {
            edit_source_->setText(path);
        }
    });
    source_layout->addWidget(btn_browse_);

    form_layout->addRow(kind_ == Kind::playlist ? "Playlist:" : "Guide:", source_layout);

    label_info_ = new QLabel("Enter a file path or URL", this);
    label_info_->setStyleSheet("color: #888; font-size: 11px; padding: 8px;");
    form_layout->addRow("", label_info_);

    layout->addLayout(form_layout);

    auto* button_layout = new QHBoxLayout();
    button_layout->addStretch();

    btn_ok_ = new QPushButton(kind_ == Kind::playlist ? "Open" : "Load", this);
    btn_ok_->setEnabled(false);
    btn_ok_->setStyleSheet(R"(
        QPushButton {
            background-color: #0078d4;
            border: none;
            border-radius: 4px;
            padding: 8px 24px;
            color: #fff;
            font-weight: bold;
        }
        QPushButton:hover { background-color: #1084e8; }
        QPushButton:disabled { background-color: #3a3a3a; color: #666; }
    )");
    connect(btn_ok_, &QPushButton::clicked, this, &QDialog::accept);
    button_layout->addWidget(btn_ok_);

    btn_cancel_ = new QPushButton("Cancel", this);
    btn_cancel_->setStyleSheet(R"(
        QPushButton {
            background-color: #3a3a3a;
            border: 1px solid #555;
            border-radius: 4px;
            padding: 8px 24px;
            color: #ccc;
        }
        QPushButton:hover { background-color: #4a4a4a; }
    )");
    connect(btn_cancel_, &QPushButton::clicked, this, &QDialog::reject);
    button_layout->addWidget(btn_cancel_);

    layout->addLayout(button_layout);
}

void SourceDialog::validate_source() {
    auto text = edit_source_->text().trimmed().toStdString();
    auto ref = core::SourceRef::parse(text);

    btn_ok_->setEnabled(ref.has_value());
    if (!ref) {
        label_info_->setText(text.empty() ? "Enter a file path or URL" : "Only local files and http(s) URLs are supported");
        return;
    }

    bool known_extension = kind_ == Kind::playlist
        ? media::M3UParser::is_playlist_path(ref->location())
        : media::XmltvParser::is_epg_path(ref->location());

    QString where = ref->is_remote()
        ? QString("Remote source on %1").arg(QString::fromStdString(ref->host()))
        : QString("Local file %1").arg(QString::fromStdString(ref->filename()));
    if (!known_extension) {
        where += kind_ == Kind::playlist ? " (not an .m3u/.m3u8 name)" : " (not an .xml name)";
    }
    label_info_->setText(where);
}

void SourceDialog::set_source(const QString& source) {
    edit_source_->setText(source);
    validate_source();
}

QString SourceDialog::source() const {
    return edit_source_->text().trimmed();
}

void SourceDialog::showEvent(QShowEvent* event) {
    QDialog::showEvent(event);
    edit_source_->setFocus();
}

} // namespace relay::gui
