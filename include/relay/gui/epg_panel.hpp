// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/guide/associator.hpp>
#include <relay/model/channel.hpp>
#include <relay/model/program.hpp>
#include <QWidget>
#include <vector>

class QLabel;
class QListWidget;
class QProgressBar;

namespace relay::gui {

// Program details of the selected channel: what is on now, how far it has
// progressed, and what follows
class EpgPanel : public QWidget {
    Q_OBJECT

public:
    explicit EpgPanel(QWidget* parent = nullptr);
    ~EpgPanel() override;

    void show_channel(const model::Channel& channel,
                      const guide::NowNext& now_next,
                      const std::vector<model::Program>& upcoming,
                      model::Instant now);

    // Placeholder state when nothing is selected
    void clear();

private:
    void setup_ui();

    QLabel* label_channel_{nullptr};
    QLabel* label_group_{nullptr};
    QLabel* label_title_{nullptr};
    QLabel* label_time_{nullptr};
    QLabel* label_description_{nullptr};
    QLabel* label_match_{nullptr};
    QProgressBar* progress_bar_{nullptr};
    QListWidget* upcoming_list_{nullptr};
};

} // namespace relay::gui
