// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/core/config.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>

namespace dashgrab::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments. Unset optionals fall back to the configuration.
struct CliArgs {
    std::string url;
    std::optional<std::string> output_dir;
    std::optional<std::string> filename;
    std::optional<std::string> resolution;
    std::optional<std::uint32_t> workers;
    std::string config_path;
    bool check_dependencies{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;       // Set when the command line is malformed
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Merge the configuration file (if any) with command-line overrides
[[nodiscard]] std::expected<core::AppConfig, std::error_code>
resolve_config(const CliArgs& args) noexcept;

// Map an iframe or stream URL to the manifest URL:
//   .../iframe -> .../manifest/video.mpd, *.mpd is kept,
//   anything else gets /manifest/video.mpd appended.
[[nodiscard]] std::string extract_manifest_url(std::string_view url);

// Replace path separators and drop characters that are invalid in filenames
[[nodiscard]] std::string sanitize_filename(std::string_view name);

// "720p" -> 720. Unparseable input yields the default height.
[[nodiscard]] std::uint32_t parse_resolution(std::string_view resolution) noexcept;

// Output filename: the manifest title when the filename was left at its
// default and the title survives sanitizing, otherwise the filename as given.
[[nodiscard]] std::string output_filename(std::string_view filename, std::string_view title);

// Set spdlog's level from the flags and configured level
void setup_logging(const CliArgs& args, const core::AppConfig& config) noexcept;

// Report whether the external tools are available
[[nodiscard]] bool check_dependencies(const core::AppConfig& config) noexcept;

// Download a DASH presentation and merge it into one file
[[nodiscard]] CliResult download(const CliArgs& args,
                                 const core::AppConfig& config,
                                 std::stop_token stoken) noexcept;

// Run the command described by args. Returns the process exit code.
[[nodiscard]] int run(const CliArgs& args, std::string_view program_name,
                      std::stop_token stoken) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace dashgrab::cli
