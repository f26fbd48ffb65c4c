// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/media/m3u_attributes.hpp>
#include <cctype>

namespace relay::media {

namespace {

bool is_blank(char c) noexcept {
    return c == ' ' || c == '\t';
}

} // namespace

std::optional<AttributeScan> scan_attributes(std::string_view text) {
    AttributeScan scan;
    std::size_t pos = 0;

    while (true) {
        while (pos < text.size() && is_blank(text[pos])) ++pos;

        if (pos >= text.size()) {
            return scan;  // No display name
        }
        if (text[pos] == ',') {
            scan.name_pos = pos + 1;
            return scan;
        }

        auto key_start = pos;
        while (pos < text.size() && text[pos] != '=' && text[pos] != ',' && !is_blank(text[pos])) {
            ++pos;
        }
        if (pos == key_start || pos >= text.size() || text[pos] != '=') {
            return std::nullopt;
        }
        std::string key(text.substr(key_start, pos - key_start));
        ++pos;  // '='

        std::string value;
        if (pos < text.size() && (text[pos] == '"' || text[pos] == '\'')) {
            char quote = text[pos++];
            auto close = text.find(quote, pos);
            if (close == std::string_view::npos) {
                return std::nullopt;
            }
            value = std::string(text.substr(pos, close - pos));
            pos = close + 1;
        } else {
            auto value_start = pos;
            while (pos < text.size() && text[pos] != ',' && !is_blank(text[pos])) {
                ++pos;
            }
            value = std::string(text.substr(value_start, pos - value_start));
        }

        scan.attributes.emplace_back(std::move(key), std::move(value));
    }
}

bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        auto c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        char32_t code = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= text.size()) {
            return false;  // Truncated sequence
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            code = (code << 6) | (cc & 0x3F);
        }

        // Overlong forms, surrogates, beyond U+10FFFF
        if ((extra == 1 && code < 0x80) || (extra == 2 && code < 0x800) ||
            (extra == 3 && code < 0x10000) || code > 0x10FFFF ||
            (code >= 0xD800 && code <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace relay::media
