// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/error.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace relay::core {

enum class SourceKind : std::uint8_t {
    local_file,
    remote
};

// Where a playlist or EPG document comes from: a local path or an http(s) URL
class SourceRef {
public:
    // Classify user input. "file://" prefixes are stripped to a local path.
    [[nodiscard]] static std::expected<SourceRef, std::error_code> parse(std::string_view text) noexcept;

    [[nodiscard]] SourceKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_remote() const noexcept { return kind_ == SourceKind::remote; }

    // Path for local sources, full URL for remote ones
    [[nodiscard]] const std::string& location() const noexcept { return location_; }
    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }

    // Last path segment without query or fragment; used for display and extension checks
    [[nodiscard]] std::string filename() const;

    [[nodiscard]] bool has_extension(std::span<const std::string_view> extensions) const;

    SourceRef() = default;

    bool operator==(const SourceRef&) const = default;

private:
    SourceKind kind_{SourceKind::local_file};
    std::string location_;
    std::string scheme_;
    std::string host_;
};

} // namespace relay::core
