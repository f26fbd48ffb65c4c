// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/media/xmltv_parser.hpp>
#include <relay/media/xmltv_time.hpp>
#include <relay/core/config.hpp>
#include <relay/core/log.hpp>
#include <QByteArray>
#include <QXmlStreamReader>
#include <algorithm>
#include <cctype>
#include <format>

namespace relay::media {

namespace {

std::string to_std(QStringView text) {
    return text.trimmed().toString().toStdString();
}

std::string element_text(QXmlStreamReader& xml) {
    return xml.readElementText(QXmlStreamReader::SkipChildElements).trimmed().toStdString();
}

// <channel id="..."><display-name>..</display-name><icon src=".."/></channel>
std::optional<model::EpgChannel> read_channel(QXmlStreamReader& xml) {
    model::EpgChannel channel;
    channel.id = to_std(xml.attributes().value(u"id"));

    while (xml.readNextStartElement()) {
        if (xml.name() == u"display-name") {
            auto name = element_text(xml);
            if (!name.empty()) {
                channel.display_names.push_back(std::move(name));
            }
        } else if (xml.name() == u"icon") {
            if (channel.icon.empty()) {
                channel.icon = to_std(xml.attributes().value(u"src"));
            }
            xml.skipCurrentElement();
        } else {
            xml.skipCurrentElement();
        }
    }

    if (channel.id.empty()) {
        return std::nullopt;
    }
    return channel;
}

// <programme channel=".." start=".." stop="..">..</programme>
std::optional<model::Program> read_programme(QXmlStreamReader& xml) {
    model::Program program;
    auto attrs = xml.attributes();
    program.channel_id = to_std(attrs.value(u"channel"));
    auto start = parse_xmltv_time(to_std(attrs.value(u"start")));
    auto stop = parse_xmltv_time(to_std(attrs.value(u"stop")));

    while (xml.readNextStartElement()) {
        auto name = xml.name();
        if (name == u"title") {
            // Several localized titles may follow; the first one is kept
            auto title = element_text(xml);
            if (program.title.empty()) program.title = std::move(title);
        } else if (name == u"sub-title") {
            auto subtitle = element_text(xml);
            if (program.subtitle.empty()) program.subtitle = std::move(subtitle);
        } else if (name == u"desc") {
            auto desc = element_text(xml);
            if (program.description.empty()) program.description = std::move(desc);
        } else if (name == u"category") {
            auto category = element_text(xml);
            if (!category.empty()) program.categories.push_back(std::move(category));
        } else if (name == u"icon") {
            if (program.icon.empty()) {
                program.icon = to_std(xml.attributes().value(u"src"));
            }
            xml.skipCurrentElement();
        } else {
            xml.skipCurrentElement();
        }
    }

    if (program.channel_id.empty() || !start || !stop || *start >= *stop) {
        return std::nullopt;
    }
    program.start = *start;
    program.stop = *stop;
    return program;
}

} // namespace

std::expected<EpgParseResult, core::IngestFailure> XmltvParser::parse(std::string_view content) {
    auto first = content.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::unexpected(core::make_failure(core::IngestErrc::format_unrecognized,
            "EPG document is empty"));
    }

    QXmlStreamReader xml(QByteArray::fromRawData(content.data(), static_cast<qsizetype>(content.size())));

    if (!xml.readNextStartElement()) {
        auto reason = xml.hasError()
            ? std::format("Not an XML document: {}", xml.errorString().toStdString())
            : std::string("XML document has no root element");
        return std::unexpected(core::make_failure(core::IngestErrc::format_unrecognized, std::move(reason)));
    }
    if (xml.name() != u"tv") {
        return std::unexpected(core::make_failure(core::IngestErrc::format_unrecognized,
            std::format("Root element is <{}>, expected <tv>", xml.name().toString().toStdString())));
    }

    EpgParseResult result;
    while (xml.readNextStartElement()) {
        if (xml.name() == u"channel") {
            auto line = xml.lineNumber();
            if (auto channel = read_channel(xml)) {
                result.guide.add_channel(std::move(*channel));
            } else if (!xml.hasError()) {
                ++result.skipped_channels;
                core::logger()->debug("Line {}: <channel> without id skipped", line);
            }
        } else if (xml.name() == u"programme") {
            auto line = xml.lineNumber();
            if (auto program = read_programme(xml)) {
                result.guide.add_program(std::move(*program));
            } else if (!xml.hasError()) {
                ++result.skipped_programs;
                core::logger()->debug("Line {}: incomplete <programme> skipped", line);
            }
        } else {
            xml.skipCurrentElement();
        }
    }

    if (xml.hasError()) {
        auto reason = std::format("XML error at line {}: {}", xml.lineNumber(),
                                  xml.errorString().toStdString());
        core::logger()->warn("{}", reason);
        return std::unexpected(core::make_failure(core::IngestErrc::format_unrecognized,
            std::move(reason), result.skipped_entries()));
    }

    result.guide.finalize();
    core::logger()->info("Parsed EPG: {} channels, {} programs ({} skipped)",
        result.guide.channel_count(), result.guide.program_count(), result.skipped_entries());
    return result;
}

bool XmltvParser::is_epg_path(std::string_view path) noexcept {
    auto cut = std::min(path.find('?'), path.find('#'));
    if (cut != std::string_view::npos) {
        path = path.substr(0, cut);
    }

    std::string lower;
    lower.reserve(path.size());
    for (char c : path) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return std::any_of(core::EPG_EXTENSIONS.begin(), core::EPG_EXTENSIONS.end(),
        [&](std::string_view ext) { return lower.ends_with(ext); });
}

} // namespace relay::media
