// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/media/xmltv_time.hpp>
#include <cctype>
#include <format>

namespace relay::media {

namespace chrono = std::chrono;

namespace {

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool read_number(std::string_view s, std::size_t pos, std::size_t count, int& out) noexcept {
    if (pos + count > s.size()) return false;
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
    }
    out = value;
    return true;
}

std::optional<chrono::sys_seconds> make_instant(int y, int mo, int d, int h, int mi, int s) noexcept {
    if (mo < 1 || mo > 12 || d < 1 || d > 31) return std::nullopt;
    chrono::year_month_day date{chrono::year{y}, chrono::month{static_cast<unsigned>(mo)},
                                chrono::day{static_cast<unsigned>(d)}};
    if (!date.ok() || h > 23 || mi > 59 || s > 59) {
        return std::nullopt;
    }
    return chrono::sys_days{date} + chrono::hours{h} + chrono::minutes{mi} + chrono::seconds{s};
}

// "", "Z", "UTC", "GMT", "+HHMM", "-HH:MM", "+HH"
std::optional<chrono::minutes> parse_offset(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty() || text == "Z" || text == "UTC" || text == "GMT") {
        return chrono::minutes{0};
    }
    if (text.front() != '+' && text.front() != '-') {
        return std::nullopt;
    }

    int sign = text.front() == '-' ? -1 : 1;
    text.remove_prefix(1);

    int hh = 0;
    int mm = 0;
    if (!read_number(text, 0, 2, hh)) return std::nullopt;
    text.remove_prefix(2);
    if (!text.empty() && text.front() == ':') text.remove_prefix(1);
    if (!text.empty()) {
        if (text.size() != 2 || !read_number(text, 0, 2, mm)) return std::nullopt;
    }
    if (hh > 23 || mm > 59) return std::nullopt;

    return chrono::minutes{sign * (hh * 60 + mm)};
}

} // namespace

std::optional<chrono::sys_seconds> parse_xmltv_time(std::string_view text) noexcept {
    text = trim(text);

    std::size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    if (digits != 12 && digits != 14) {
        return std::nullopt;
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    read_number(text, 0, 4, y);
    read_number(text, 4, 2, mo);
    read_number(text, 6, 2, d);
    read_number(text, 8, 2, h);
    read_number(text, 10, 2, mi);
    if (digits == 14) {
        read_number(text, 12, 2, s);
    }

    auto local = make_instant(y, mo, d, h, mi, s);
    auto offset = parse_offset(text.substr(digits));
    if (!local || !offset) {
        return std::nullopt;
    }
    return *local - *offset;
}

std::string format_xmltv_time(chrono::sys_seconds instant) {
    return std::format("{:%Y%m%d%H%M%S} +0000", instant);
}

std::optional<chrono::sys_seconds> parse_iso8601(std::string_view text) noexcept {
    text = trim(text);

    // YYYY-MM-DD[T ]HH:MM[:SS][offset]
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_number(text, 0, 4, y) || text.size() < 16 || text[4] != '-' ||
        !read_number(text, 5, 2, mo) || text[7] != '-' || !read_number(text, 8, 2, d) ||
        (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
        !read_number(text, 11, 2, h) || text[13] != ':' || !read_number(text, 14, 2, mi)) {
        return std::nullopt;
    }

    std::size_t pos = 16;
    if (pos < text.size() && text[pos] == ':') {
        if (!read_number(text, pos + 1, 2, s)) return std::nullopt;
        pos += 3;
    }

    auto local = make_instant(y, mo, d, h, mi, s);
    auto offset = parse_offset(text.substr(pos));
    if (!local || !offset) {
        return std::nullopt;
    }
    return *local - *offset;
}

} // namespace relay::media
