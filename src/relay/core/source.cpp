// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/core/source.hpp>
#include <algorithm>
#include <cctype>

namespace relay::core {

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

std::string to_lower(std::string_view s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

// Windows drive letters ("C:\...") are not URL schemes
bool looks_like_drive(std::string_view text) noexcept {
    return text.size() >= 2 && std::isalpha(static_cast<unsigned char>(text[0])) && text[1] == ':';
}

} // namespace

std::expected<SourceRef, std::error_code> SourceRef::parse(std::string_view text) noexcept {
    text = trim(text);
    if (text.empty()) {
        return std::unexpected(make_error_code(IngestErrc::source_unavailable));
    }

    SourceRef source;

    auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || looks_like_drive(text)) {
        source.kind_ = SourceKind::local_file;
        source.location_ = std::string(text);
        return source;
    }

    source.scheme_ = to_lower(text.substr(0, scheme_end));
    auto rest = text.substr(scheme_end + 3);

    if (source.scheme_ == "file") {
        if (rest.empty()) {
            return std::unexpected(make_error_code(IngestErrc::source_unavailable));
        }
        source.kind_ = SourceKind::local_file;
        source.location_ = std::string(rest);
        return source;
    }

    if (source.scheme_ != "http" && source.scheme_ != "https") {
        return std::unexpected(make_error_code(IngestErrc::source_unavailable));
    }

    // host ends at the first of: /, ?, #, or end
    auto host_end = std::min({rest.find('/'), rest.find('?'), rest.find('#'), rest.size()});
    auto authority = rest.substr(0, host_end);

    // Skip user:pass@
    if (auto at_pos = authority.rfind('@'); at_pos != std::string_view::npos) {
        authority.remove_prefix(at_pos + 1);
    }

    // Strip the port, leaving IPv6 brackets intact
    if (!authority.empty() && authority.front() == '[') {
        auto bracket_end = authority.find(']');
        if (bracket_end != std::string_view::npos) {
            authority = authority.substr(0, bracket_end + 1);
        }
    } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        return std::unexpected(make_error_code(IngestErrc::source_unavailable));
    }

    source.kind_ = SourceKind::remote;
    source.host_ = to_lower(authority);
    source.location_ = std::string(text);
    return source;
}

std::string SourceRef::filename() const {
    std::string_view path = location_;

    if (kind_ == SourceKind::remote) {
        auto cut = std::min(path.find('?'), path.find('#'));
        if (cut != std::string_view::npos) {
            path = path.substr(0, cut);
        }
        path.remove_prefix(std::min(path.size(), scheme_.size() + 3));
    }

    auto last_slash = path.find_last_of("/\\");
    if (last_slash == std::string_view::npos) {
        return std::string(path);
    }
    auto name = path.substr(last_slash + 1);
    return name.empty() ? std::string(host_) : std::string(name);
}

bool SourceRef::has_extension(std::span<const std::string_view> extensions) const {
    auto lower = to_lower(filename());
    return std::any_of(extensions.begin(), extensions.end(), [&](std::string_view ext) {
        return lower.ends_with(ext);
    });
}

} // namespace relay::core
