// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace relay::cli {

// CLI result (process exit code)
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    channels,
    groups,
    guide,
    schedule,
    export_playlist,
    url,
    favorites,
    playlists,
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> operands;   // Positional arguments after the command
    std::string group;                   // -g
    std::string query;                   // -s
    std::string at;                      // -t, ISO 8601 instant
    std::string output_file;             // -o
    std::string store_path;              // --store
    std::size_t limit{0};                // -n, 0 = default
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                   // Set when the command line is unusable
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Run the parsed command
[[nodiscard]] CliResult run(const CliArgs& args) noexcept;

// List channels of a playlist, optionally filtered by group and name
[[nodiscard]] CliResult list_channels(const CliArgs& args) noexcept;

// List playlist categories with channel counts
[[nodiscard]] CliResult list_groups(const CliArgs& args) noexcept;

// Current and next program of every channel
[[nodiscard]] CliResult show_guide(const CliArgs& args) noexcept;

// Upcoming programs of one channel
[[nodiscard]] CliResult show_schedule(const CliArgs& args) noexcept;

// Re-serialize a playlist to a file
[[nodiscard]] CliResult export_playlist(const CliArgs& args) noexcept;

// Print the stream URL of one channel
[[nodiscard]] CliResult print_url(const CliArgs& args) noexcept;

// fav add|remove|list
[[nodiscard]] CliResult manage_favorites(const CliArgs& args) noexcept;

// playlists add|remove|list: named playlist sources kept in the library
[[nodiscard]] CliResult manage_playlists(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace relay::cli
