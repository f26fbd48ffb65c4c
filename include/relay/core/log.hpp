// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace relay::core {

// Shared "relay" logger. Created on first use with a stderr sink at info level.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// Reconfigure the shared logger level (CLI -V / -q, GUI startup)
void init_logging(spdlog::level::level_enum level);

} // namespace relay::core
