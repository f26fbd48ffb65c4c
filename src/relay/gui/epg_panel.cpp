// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/gui/epg_panel.hpp>

#include <QDateTime>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QProgressBar>
#include <QVBoxLayout>

namespace relay::gui {

namespace {

QDateTime to_local(model::Instant t) {
    return QDateTime::fromSecsSinceEpoch(t.time_since_epoch().count()).toLocalTime();
}

QString time_range(const model::Program& program) {
    return QString("%1 - %2 (%3 min)")
        .arg(to_local(program.start).toString("HH:mm"))
        .arg(to_local(program.stop).toString("HH:mm"))
        .arg(program.duration().count());
}

QString match_hint(guide::MatchConfidence confidence) {
    switch (confidence) {
        case guide::MatchConfidence::exact: return {};
        case guide::MatchConfidence::name:  return "Guide matched by channel name";
        default:                            return "No guide data for this channel";
    }
}

} // namespace

EpgPanel::EpgPanel(QWidget* parent)
    : QWidget(parent) {
    setup_ui();
    clear();
}

EpgPanel::~EpgPanel() = default;

void EpgPanel::setup_ui() {
    auto* main_layout = new QVBoxLayout(this);
    main_layout->setContentsMargins(12, 12, 12, 12);

    // Channel name and group row
    auto* top_layout = new QHBoxLayout();
    label_channel_ = new QLabel(this);
    label_channel_->setStyleSheet("font-size: 16px; font-weight: bold; color: #fff;");
    top_layout->addWidget(label_channel_);
    top_layout->addStretch();
    label_group_ = new QLabel(this);
    label_group_->setStyleSheet("color: #888; font-size: 11px;");
    top_layout->addWidget(label_group_);
    main_layout->addLayout(top_layout);

    label_title_ = new QLabel(this);
    label_title_->setStyleSheet("font-size: 14px; font-weight: bold; color: #2a82da;");
    label_title_->setWordWrap(true);
    main_layout->addWidget(label_title_);

    label_time_ = new QLabel(this);
    label_time_->setStyleSheet("color: #aaa; font-size: 11px;");
    main_layout->addWidget(label_time_);

    // Elapsed share of the current program
    progress_bar_ = new QProgressBar(this);
    progress_bar_->setRange(0, 10000);
    progress_bar_->setTextVisible(false);
    progress_bar_->setStyleSheet(R"(
        QProgressBar {
            border: none;
            background-color: #333;
            border-radius: 3px;
            height: 6px;
        }
        QProgressBar::chunk {
            background-color: #0078d4;
            border-radius: 3px;
        }
    )");
    main_layout->addWidget(progress_bar_);

    label_description_ = new QLabel(this);
    label_description_->setStyleSheet("color: #ccc;");
    label_description_->setWordWrap(true);
    label_description_->setAlignment(Qt::AlignTop | Qt::AlignLeft);
    main_layout->addWidget(label_description_);

    label_match_ = new QLabel(this);
    label_match_->setStyleSheet("color: #d0a040; font-size: 11px;");
    main_layout->addWidget(label_match_);

    auto* upcoming_header = new QLabel("Up next", this);
    upcoming_header->setStyleSheet("color: #888; font-weight: bold; margin-top: 8px;");
    main_layout->addWidget(upcoming_header);

    upcoming_list_ = new QListWidget(this);
    upcoming_list_->setSelectionMode(QAbstractItemView::NoSelection);
    upcoming_list_->setStyleSheet(R"(
        QListWidget {
            background-color: #252525;
            border: none;
            border-radius: 4px;
        }
        QListWidget::item {
            padding: 6px;
            border-bottom: 1px solid #333;
        }
    )");
    main_layout->addWidget(upcoming_list_, 1);
}

void EpgPanel::show_channel(const model::Channel& channel,
                            const guide::NowNext& now_next,
                            const std::vector<model::Program>& upcoming,
                            model::Instant now) {
    label_channel_->setText(QString::fromStdString(channel.name));
    label_group_->setText(QString::fromStdString(channel.group));
    label_match_->setText(match_hint(now_next.confidence));

    if (now_next.current) {
        const auto& program = *now_next.current;
        label_title_->setText(QString::fromStdString(program.title));
        label_time_->setText(time_range(program));
        label_description_->setText(QString::fromStdString(program.description));

        auto total = (program.stop - program.start).count();
        auto elapsed = (now - program.start).count();
        progress_bar_->setValue(total > 0 ? static_cast<int>(elapsed * 10000 / total) : 0);
        progress_bar_->setVisible(true);
    } else {
        label_title_->setText(now_next.confidence == guide::MatchConfidence::none ? "" : "No program information");
        label_time_->clear();
        label_description_->clear();
        progress_bar_->setVisible(false);
    }

    upcoming_list_->clear();
    for (const auto& program : upcoming) {
        if (now_next.current && program == *now_next.current) {
            continue;
        }
        upcoming_list_->addItem(QString("%1  %2")
            .arg(to_local(program.start).toString("ddd HH:mm"))
            .arg(QString::fromStdString(program.title)));
    }
}

void EpgPanel::clear() {
    label_channel_->setText("Select a channel");
    label_group_->clear();
    label_title_->clear();
    label_time_->clear();
    label_description_->clear();
    label_match_->clear();
    progress_bar_->setVisible(false);
    upcoming_list_->clear();
}

} // namespace relay::gui
