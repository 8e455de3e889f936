// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace dashgrab::core {

constexpr std::uint32_t DEFAULT_WORKERS = 5;
constexpr std::uint32_t MAX_WORKERS = 64;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;                     // No bytes for this long aborts a fetch

constexpr std::size_t READ_BUFFER_SIZE = 256 * 1024;               // 256 KB

constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::string_view NUMBER_PLACEHOLDER = "$Number$";
constexpr std::string_view REPRESENTATION_PLACEHOLDER = "$RepresentationID$";

constexpr std::string_view DEFAULT_OUTPUT_DIR = "data/download";
constexpr std::string_view DEFAULT_FILENAME = "output.mp4";
constexpr std::string_view DEFAULT_RESOLUTION = "1080p";
constexpr std::uint32_t DEFAULT_HEIGHT = 1080;

// Runtime settings. Defaults mirror the constants above; a JSON file and
// command-line flags may override them.
struct AppConfig {
    std::uint32_t workers{DEFAULT_WORKERS};
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
    std::string output_dir{DEFAULT_OUTPUT_DIR};
    std::string resolution{DEFAULT_RESOLUTION};
    std::string ffmpeg{"ffmpeg"};
    std::string temp_dir;                 // Empty: system temp directory
    std::string log_level{"info"};

    // Load settings from a JSON document. Missing keys keep their defaults.
    [[nodiscard]] static std::expected<AppConfig, std::error_code>
    from_json(std::string_view json_text) noexcept;

    // Load settings from a JSON file on disk
    [[nodiscard]] static std::expected<AppConfig, std::error_code>
    load(const std::string& path) noexcept;
};

} // namespace dashgrab::core
