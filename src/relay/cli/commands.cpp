// Copyright (c) 2026 changcheng967. All rights reserved.

#include <relay/cli/commands.hpp>
#include <relay/core/config.hpp>
#include <relay/core/error.hpp>
#include <relay/core/http_client.hpp>
#include <relay/core/source.hpp>
#include <relay/core/source_reader.hpp>
#include <relay/guide/associator.hpp>
#include <relay/media/m3u_writer.hpp>
#include <relay/media/xmltv_time.hpp>
#include <relay/session/session.hpp>
#include <relay/session/source_loader.hpp>
#include <relay/store/library_store.hpp>
#include <relay/version.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>

using namespace relay::core;

namespace chrono = std::chrono;

namespace relay::cli {

namespace {

constexpr int EXIT_USAGE = 2;

struct CommandName {
    std::string_view name;
    Command command;
};

constexpr CommandName COMMANDS[] = {
    {"channels", Command::channels},
    {"groups", Command::groups},
    {"guide", Command::guide},
    {"schedule", Command::schedule},
    {"export", Command::export_playlist},
    {"url", Command::url},
    {"fav", Command::favorites},
    {"playlists", Command::playlists},
};

int usage_error(std::string_view message) {
    std::cerr << "Error: " << message << std::endl;
    std::cerr << "Use -h for help" << std::endl;
    return EXIT_USAGE;
}

std::string format_time(model::Instant t) {
    return std::format("{:%H:%M}", t);
}

std::string format_date_time(model::Instant t) {
    return std::format("{:%Y-%m-%d %H:%M}", t);
}

// Instant from -t, or now
std::optional<model::Instant> query_instant(const CliArgs& args) {
    if (args.at.empty()) {
        return chrono::floor<chrono::seconds>(chrono::system_clock::now());
    }
    if (auto t = media::parse_iso8601(args.at)) {
        return t;
    }
    return media::parse_xmltv_time(args.at);
}

// Blocking reload through the same loader the GUI uses
std::optional<IngestFailure> load(session::SourceLoader& loader, session::ReloadTarget target,
                                  const std::string& source, bool quiet) {
    session::ReloadOutcome outcome;
    auto capture = [&outcome](const session::ReloadOutcome& result) { outcome = result; };

    if (target == session::ReloadTarget::playlist) {
        loader.reload_playlist(source, capture);
    } else {
        loader.reload_epg(source, capture);
    }
    loader.wait();

    if (outcome.status != session::ReloadStatus::applied) {
        return outcome.failure.value_or(make_failure(IngestErrc::source_unavailable, {}));
    }
    if (outcome.skipped_entries > 0 && !quiet) {
        std::cerr << "Warning: " << outcome.skipped_entries << " malformed entries skipped in "
                  << source << std::endl;
    }
    return std::nullopt;
}

// Loaded session for commands that read a playlist (and maybe an EPG)
class Workspace {
public:
    Workspace()
        : loader_(session_, reader_) {}

    std::optional<IngestFailure> load_playlist(const std::string& source, bool quiet) {
        return load(loader_, session::ReloadTarget::playlist, source, quiet);
    }

    std::optional<IngestFailure> load_epg(const std::string& source, bool quiet) {
        return load(loader_, session::ReloadTarget::epg, source, quiet);
    }

    [[nodiscard]] std::shared_ptr<const session::Dataset> snapshot() const { return session_.snapshot(); }

private:
    session::Session session_;
    DefaultSourceReader reader_;
    session::SourceLoader loader_;
};

CliResult report(const IngestFailure& failure, std::string_view what) {
    std::cerr << "Error: Failed to load " << what << ": " << failure.describe() << std::endl;
    return std::unexpected(failure.code);
}

store::LibraryStore open_store(const CliArgs& args) {
    auto path = args.store_path.empty() ? store::LibraryStore::default_path() : args.store_path;
    auto opened = store::LibraryStore::open(path);
    if (!opened) {
        std::cerr << "Warning: Ignoring library " << path << ": " << opened.error().message() << std::endl;
        return store::LibraryStore(path);
    }
    return std::move(*opened);
}

// "@name" refers to a saved playlist; anything else is a source as given
std::string playlist_source(const CliArgs& args, const std::string& operand) {
    if (operand.size() < 2 || operand.front() != '@') {
        return operand;
    }
    auto library = open_store(args);
    auto name = std::string_view(operand).substr(1);
    for (const auto& saved : library.playlists()) {
        if (saved.name == name) {
            return saved.path;
        }
    }
    return operand;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;

    auto take_value = [&](int& i, std::string_view option, std::string& target) {
        if (i + 1 < argc) {
            target = argv[++i];
        } else if (args.error.empty()) {
            args.error = std::format("Option {} requires a value", option);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }

        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-g" || arg == "--group") {
            take_value(i, arg, args.group);
        } else if (arg == "-s" || arg == "--search") {
            take_value(i, arg, args.query);
        } else if (arg == "-t" || arg == "--time") {
            take_value(i, arg, args.at);
        } else if (arg == "-o" || arg == "--output") {
            take_value(i, arg, args.output_file);
        } else if (arg == "--store") {
            take_value(i, arg, args.store_path);
        } else if (arg == "-n" || arg == "--limit") {
            std::string value;
            take_value(i, arg, value);
            if (!value.empty()) {
                char* end = nullptr;
                args.limit = std::strtoul(value.c_str(), &end, 10);
                if (end == nullptr || *end != '\0' || args.limit == 0) {
                    args.limit = 0;
                    if (args.error.empty()) args.error = "Invalid limit: " + value;
                }
            }
        } else if (arg.size() > 1 && arg.front() == '-') {
            if (args.error.empty()) args.error = "Unknown option: " + arg;
        } else if (args.command == Command::none) {
            for (const auto& entry : COMMANDS) {
                if (entry.name == arg) {
                    args.command = entry.command;
                    break;
                }
            }
            if (args.command == Command::none && args.error.empty()) {
                args.error = "Unknown command: " + arg;
            }
        } else {
            args.operands.push_back(std::move(arg));
        }
    }

    return args;
}

//=============================================================================
// Commands
//=============================================================================

CliResult run(const CliArgs& args) noexcept {
    try {
        switch (args.command) {
            case Command::channels:        return list_channels(args);
            case Command::groups:          return list_groups(args);
            case Command::guide:           return show_guide(args);
            case Command::schedule:        return show_schedule(args);
            case Command::export_playlist: return export_playlist(args);
            case Command::url:             return print_url(args);
            case Command::favorites:       return manage_favorites(args);
            case Command::playlists:       return manage_playlists(args);
            case Command::none:            break;
        }
        return usage_error("No command specified");
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

CliResult list_channels(const CliArgs& args) noexcept {
    if (args.operands.size() != 1) {
        return usage_error("channels expects <playlist>");
    }

    Workspace workspace;
    if (auto failure = workspace.load_playlist(playlist_source(args, args.operands[0]), args.quiet)) {
        return report(*failure, "playlist");
    }
    auto dataset = workspace.snapshot();
    const auto& playlist = *dataset->playlist;
    auto library = open_store(args);

    auto matches = playlist.search(args.query);
    std::size_t shown = 0;
    for (const auto* channel : matches) {
        if (!args.group.empty() && channel->group != args.group) {
            continue;
        }
        std::cout << std::format("{} {:<28} {:<20} {}\n",
            library.is_favorite(*channel) ? '*' : ' ', channel->identifier, channel->group, channel->name);
        ++shown;
    }

    if (!args.quiet) {
        std::cout << shown << " of " << playlist.size() << " channels" << std::endl;
    }
    return 0;
}

CliResult list_groups(const CliArgs& args) noexcept {
    if (args.operands.size() != 1) {
        return usage_error("groups expects <playlist>");
    }

    Workspace workspace;
    if (auto failure = workspace.load_playlist(playlist_source(args, args.operands[0]), args.quiet)) {
        return report(*failure, "playlist");
    }
    auto dataset = workspace.snapshot();

    for (const auto& group : dataset->playlist->categories()) {
        std::cout << std::format("{:<32} {}\n", group, dataset->playlist->channels_in(group).size());
    }
    return 0;
}

CliResult show_guide(const CliArgs& args) noexcept {
    if (args.operands.size() != 2) {
        return usage_error("guide expects <playlist> <epg>");
    }
    auto at = query_instant(args);
    if (!at) {
        return usage_error("Invalid time: " + args.at);
    }

    Workspace workspace;
    if (auto failure = workspace.load_playlist(playlist_source(args, args.operands[0]), args.quiet)) {
        return report(*failure, "playlist");
    }
    if (auto failure = workspace.load_epg(args.operands[1], args.quiet)) {
        return report(*failure, "EPG");
    }
    auto dataset = workspace.snapshot();

    guide::Associator associator;
    std::size_t bound = 0;
    for (const auto& channel : dataset->playlist->channels()) {
        if (!args.group.empty() && channel.group != args.group) {
            continue;
        }

        auto info = associator.now_next(*dataset, channel, *at);
        if (info.confidence != guide::MatchConfidence::none) {
            ++bound;
        }

        std::string now = info.current
            ? std::format("{}-{} {}", format_time(info.current->start), format_time(info.current->stop),
                          info.current->title)
            : std::string("-");
        std::string next = info.next
            ? std::format("{} {}", format_time(info.next->start), info.next->title)
            : std::string("-");

        // '~' marks a name-based match
        char marker = info.confidence == guide::MatchConfidence::name ? '~' : ' ';
        std::cout << std::format("{:<28}{} now: {:<40} next: {}\n", channel.name, marker, now, next);
    }

    if (!args.quiet) {
        std::cout << std::format("{} of {} channels have guide data at {} UTC\n",
            bound, dataset->playlist->size(), format_date_time(*at));
    }
    return 0;
}

CliResult show_schedule(const CliArgs& args) noexcept {
    if (args.operands.size() != 3) {
        return usage_error("schedule expects <playlist> <epg> <identifier>");
    }
    auto at = query_instant(args);
    if (!at) {
        return usage_error("Invalid time: " + args.at);
    }

    Workspace workspace;
    if (auto failure = workspace.load_playlist(playlist_source(args, args.operands[0]), args.quiet)) {
        return report(*failure, "playlist");
    }
    if (auto failure = workspace.load_epg(args.operands[1], args.quiet)) {
        return report(*failure, "EPG");
    }
    auto dataset = workspace.snapshot();

    const auto* channel = dataset->playlist->find(args.operands[2]);
    if (channel == nullptr) {
        std::cerr << "Error: No channel with identifier " << args.operands[2] << std::endl;
        return 1;
    }

    guide::Associator associator;
    auto binding = associator.bind(*dataset, *channel);
    if (!binding.bound()) {
        std::cout << "No guide data for " << channel->name << std::endl;
        return 0;
    }

    std::cout << std::format("{} ({} match on EPG channel {})\n", channel->name,
        guide::to_string(binding.confidence), binding.epg_channel_id);

    auto limit = args.limit > 0 ? args.limit : UPCOMING_PROGRAMS;
    for (const auto& program : associator.upcoming(*dataset, *channel, *at, limit)) {
        std::cout << std::format("{} {} - {}  {}\n", program.airs_at(*at) ? '>' : ' ',
            format_date_time(program.start), format_time(program.stop), program.title);
        if (args.verbose && !program.description.empty()) {
            std::cout << "      " << program.description << '\n';
        }
    }
    return 0;
}

CliResult export_playlist(const CliArgs& args) noexcept {
    if (args.operands.size() != 1 || args.output_file.empty()) {
        return usage_error("export expects <playlist> -o <file>");
    }

    Workspace workspace;
    if (auto failure = workspace.load_playlist(playlist_source(args, args.operands[0]), args.quiet)) {
        return report(*failure, "playlist");
    }
    auto dataset = workspace.snapshot();

    if (auto ec = media::M3UWriter::save(*dataset->playlist, args.output_file)) {
        std::cerr << "Error: Cannot write " << args.output_file << ": " << ec.message() << std::endl;
        return std::unexpected(ec);
    }
    if (!args.quiet) {
        std::cout << "Wrote " << dataset->playlist->size() << " channels to " << args.output_file << std::endl;
    }
    return 0;
}

CliResult print_url(const CliArgs& args) noexcept {
    if (args.operands.size() != 2) {
        return usage_error("url expects <playlist> <identifier>");
    }

    Workspace workspace;
    if (auto failure = workspace.load_playlist(playlist_source(args, args.operands[0]), args.quiet)) {
        return report(*failure, "playlist");
    }
    auto dataset = workspace.snapshot();

    const auto* channel = dataset->playlist->find(args.operands[1]);
    if (channel == nullptr) {
        std::cerr << "Error: No channel with identifier " << args.operands[1] << std::endl;
        return 1;
    }
    std::cout << channel->url << std::endl;
    return 0;
}

CliResult manage_favorites(const CliArgs& args) noexcept {
    if (args.operands.empty()) {
        return usage_error("fav expects add|remove|list");
    }
    const auto& action = args.operands[0];

    auto path = args.store_path.empty() ? store::LibraryStore::default_path() : args.store_path;
    auto opened = store::LibraryStore::open(path);
    if (!opened) {
        std::cerr << "Error: Cannot open library " << path << ": " << opened.error().message() << std::endl;
        return std::unexpected(opened.error());
    }
    auto& library = *opened;

    if (action == "list") {
        for (const auto& favorite : library.favorites()) {
            std::cout << std::format("{:<28} {:<20} {}\n", favorite.identifier, favorite.group, favorite.name);
        }
        return 0;
    }

    if (action == "add") {
        if (args.operands.size() != 3) {
            return usage_error("fav add expects <playlist> <identifier>");
        }
        Workspace workspace;
        if (auto failure = workspace.load_playlist(playlist_source(args, args.operands[1]), args.quiet)) {
            return report(*failure, "playlist");
        }
        auto dataset = workspace.snapshot();
        const auto* channel = dataset->playlist->find(args.operands[2]);
        if (channel == nullptr) {
            std::cerr << "Error: No channel with identifier " << args.operands[2] << std::endl;
            return 1;
        }
        library.add_favorite(store::Favorite::from_channel(*channel));
    } else if (action == "remove") {
        if (args.operands.size() != 2) {
            return usage_error("fav remove expects <identifier>");
        }
        if (!library.remove_favorite(args.operands[1])) {
            std::cerr << "Error: " << args.operands[1] << " is not a favorite" << std::endl;
            return 1;
        }
    } else {
        return usage_error("Unknown fav action: " + action);
    }

    if (auto ec = library.save()) {
        std::cerr << "Error: Cannot save library " << path << ": " << ec.message() << std::endl;
        return std::unexpected(ec);
    }
    return 0;
}

CliResult manage_playlists(const CliArgs& args) noexcept {
    if (args.operands.empty()) {
        return usage_error("playlists expects add|remove|list");
    }
    const auto& action = args.operands[0];

    auto path = args.store_path.empty() ? store::LibraryStore::default_path() : args.store_path;
    auto opened = store::LibraryStore::open(path);
    if (!opened) {
        std::cerr << "Error: Cannot open library " << path << ": " << opened.error().message() << std::endl;
        return std::unexpected(opened.error());
    }
    auto& library = *opened;

    if (action == "list") {
        for (const auto& saved : library.playlists()) {
            std::cout << std::format("{:<24} {:<5} {}\n", saved.name, saved.is_url ? "url" : "file", saved.path);
        }
        return 0;
    }

    if (action == "add") {
        if (args.operands.size() != 3) {
            return usage_error("playlists add expects <name> <playlist>");
        }
        auto ref = SourceRef::parse(args.operands[2]);
        if (!ref) {
            std::cerr << "Error: Unusable playlist source " << args.operands[2] << ": "
                      << ref.error().message() << std::endl;
            return std::unexpected(ref.error());
        }

        // Local files are stored by absolute path so they resolve from any directory
        std::string location = args.operands[2];
        if (!ref->is_remote()) {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(ref->location(), ec);
            location = ec ? ref->location() : absolute.string();
        }
        library.add_playlist(store::SavedPlaylist{args.operands[1], std::move(location), ref->is_remote()});
    } else if (action == "remove") {
        if (args.operands.size() != 2) {
            return usage_error("playlists remove expects <name>");
        }
        if (!library.remove_playlist(args.operands[1])) {
            std::cerr << "Error: No saved playlist named " << args.operands[1] << std::endl;
            return 1;
        }
    } else {
        return usage_error("Unknown playlists action: " + action);
    }

    if (auto ec = library.save()) {
        std::cerr << "Error: Cannot save library " << path << ": " << ec.message() << std::endl;
        return std::unexpected(ec);
    }
    return 0;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Relay IPTV " << program_name << " - Playlist and program guide tool\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <COMMAND> [ARGS]...\n";
    std::cout << "\n";
    std::cout << "COMMANDS:\n";
    std::cout << "  channels <playlist>                   List channels\n";
    std::cout << "  groups <playlist>                     List categories\n";
    std::cout << "  guide <playlist> <epg>                Current and next program per channel\n";
    std::cout << "  schedule <playlist> <epg> <id>        Upcoming programs of a channel\n";
    std::cout << "  export <playlist> -o <file>           Write the playlist as M3U\n";
    std::cout << "  url <playlist> <id>                   Print a channel's stream URL\n";
    std::cout << "  fav add <playlist> <id>               Add a favorite\n";
    std::cout << "  fav remove <id>                       Remove a favorite\n";
    std::cout << "  fav list                              List favorites\n";
    std::cout << "  playlists add <name> <playlist>       Save a playlist source under a name\n";
    std::cout << "  playlists remove <name>               Forget a saved playlist\n";
    std::cout << "  playlists list                        List saved playlists\n";
    std::cout << "\n";
    std::cout << "Playlists and guides may be local files or http(s) URLs.\n";
    std::cout << "A playlist given as @<name> is looked up among the saved playlists.\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable debug logging\n";
    std::cout << "  -q, --quiet             Only log warnings and errors\n";
    std::cout << "  -g, --group <NAME>      Only channels of this category\n";
    std::cout << "  -s, --search <TEXT>     Only channels whose name contains TEXT\n";
    std::cout << "  -t, --time <ISO8601>    Query instant (default: now), e.g. 2024-01-01T12:30:00Z\n";
    std::cout << "  -n, --limit <N>         Number of upcoming programs (default: " << UPCOMING_PROGRAMS << ")\n";
    std::cout << "  -o, --output <FILE>     Export destination\n";
    std::cout << "      --store <FILE>      Library file (default: " << store::LibraryStore::default_path() << ")\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " channels -g News playlist.m3u\n";
    std::cout << "  " << program_name << " guide https://example.com/tv.m3u guide.xml\n";
    std::cout << "  " << program_name << " schedule tv.m3u guide.xml ch1 -t 2024-01-01T12:30:00Z\n";
    std::cout << "\n";
    std::cout << "Created by changcheng967\n";
}

void print_version() noexcept {
    std::cout << "Relay IPTV " << relay::version.to_string() << std::endl;
    std::cout << "Created by changcheng967\n";
    std::cout << "\n";
    std::cout << "Built with C++23, Qt 6, libcurl\n";
}

} // namespace relay::cli
