// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>

namespace relay::core {

enum class IngestErrc {
    success = 0,
    malformed_entry,
    source_unavailable,
    format_unrecognized,
    network_error,
    timeout,
    not_found,
    server_error,
    permission_denied,
    cancelled,
    superseded,
    store_error,
};

namespace detail {

struct IngestErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "relay::ingest";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<IngestErrc>(ev)) {
            case IngestErrc::success:             return "Success";
            case IngestErrc::malformed_entry:     return "Malformed entry";
            case IngestErrc::source_unavailable:  return "Source unavailable";
            case IngestErrc::format_unrecognized: return "Unrecognized format";
            case IngestErrc::network_error:       return "Network error";
            case IngestErrc::timeout:             return "Operation timed out";
            case IngestErrc::not_found:           return "Resource not found (404)";
            case IngestErrc::server_error:        return "Server error (5xx)";
            case IngestErrc::permission_denied:   return "Permission denied";
            case IngestErrc::cancelled:           return "Reload cancelled";
            case IngestErrc::superseded:          return "Reload superseded by a newer request";
            case IngestErrc::store_error:         return "Library store error";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::IngestErrcCategory& ingest_errc_category() noexcept {
    static detail::IngestErrcCategory category;
    return category;
}

inline std::error_code make_error_code(IngestErrc e) noexcept {
    return {static_cast<int>(e), ingest_errc_category()};
}

// Failure of a parse or a whole reload attempt.
// skipped_entries carries what a partial parse had already discarded.
struct IngestFailure {
    std::error_code code;
    std::string reason;
    std::size_t skipped_entries{0};

    [[nodiscard]] std::string describe() const {
        std::string text = reason.empty() ? code.message() : reason;
        if (skipped_entries > 0) {
            text += " (" + std::to_string(skipped_entries) + " entries skipped)";
        }
        return text;
    }
};

inline IngestFailure make_failure(IngestErrc e, std::string reason, std::size_t skipped = 0) {
    return IngestFailure{make_error_code(e), std::move(reason), skipped};
}

} // namespace relay::core

namespace std {

template<>
struct is_error_code_enum<relay::core::IngestErrc> : true_type {};

} // namespace std
