// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace relay::media {

// Parse an XMLTV date-time ("20240101120000 +0100") into a UTC instant.
// Accepts YYYYMMDDHHMM[SS] with an optional [+-]HHMM offset; no offset means UTC.
[[nodiscard]] std::optional<std::chrono::sys_seconds> parse_xmltv_time(std::string_view text) noexcept;

// UTC instant as "YYYYMMDDHHMMSS +0000"
[[nodiscard]] std::string format_xmltv_time(std::chrono::sys_seconds instant);

// ISO 8601 "2024-01-01T12:30:00Z" (offset or Z optional, UTC assumed); for CLI input
[[nodiscard]] std::optional<std::chrono::sys_seconds> parse_iso8601(std::string_view text) noexcept;

} // namespace relay::media
