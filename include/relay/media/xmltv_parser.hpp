// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <relay/core/error.hpp>
#include <relay/model/program.hpp>
#include <cstddef>
#include <expected>
#include <string_view>

namespace relay::media {

struct EpgParseResult {
    model::EpgGuide guide;
    std::size_t skipped_channels{0};    // <channel> without id
    std::size_t skipped_programs{0};    // missing channel/start/stop, bad timestamp, start >= stop

    [[nodiscard]] std::size_t skipped_entries() const noexcept {
        return skipped_channels + skipped_programs;
    }
};

// XMLTV electronic program guide parser
class XmltvParser {
public:
    // Parse an XMLTV document. Schedules of the returned guide are finalized.
    // Fails with IngestErrc::format_unrecognized when the text is not a
    // well-formed <tv> document.
    [[nodiscard]] static std::expected<EpgParseResult, core::IngestFailure>
    parse(std::string_view content);

    // Check if a path or URL names an XMLTV file
    [[nodiscard]] static bool is_epg_path(std::string_view path) noexcept;
};

} // namespace relay::media
