// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace relay::core {

namespace {

constexpr const char* LOGGER_NAME = "relay";
constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S [%n] %^%l%$: %v";

std::once_flag g_logger_once;

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_logger_once, [] {
        if (!spdlog::get(LOGGER_NAME)) {
            auto log = spdlog::stderr_color_mt(LOGGER_NAME);
            log->set_pattern(LOG_PATTERN);
            log->set_level(spdlog::level::info);
        }
    });
    return spdlog::get(LOGGER_NAME);
}

void init_logging(spdlog::level::level_enum level) {
    auto log = logger();
    log->set_level(level);
    log->flush_on(spdlog::level::warn);
}

} // namespace relay::core
