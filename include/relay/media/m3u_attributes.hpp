// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relay::media {

using AttributeList = std::vector<std::pair<std::string, std::string>>;

struct AttributeScan {
    AttributeList attributes;                        // Source order
    std::size_t name_pos{std::string_view::npos};    // Just past the name comma, npos if none
};

// Scan `key="value" key2=value2 ...` up to the first comma outside quotes.
// Returns nullopt for an unterminated quote or a key without '='.
[[nodiscard]] std::optional<AttributeScan> scan_attributes(std::string_view text);

[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

} // namespace relay::media
