// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/core/error.hpp>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dashgrab::media {

// Runs argv[0] with the given arguments and returns its exit status.
// Spawn failures are reported as an error code.
using ProcessRunner = std::function<std::expected<int, std::error_code>(const std::vector<std::string>& argv)>;

// Default runner: posix_spawnp + waitpid
[[nodiscard]] std::expected<int, std::error_code> run_process(const std::vector<std::string>& argv);

// Search PATH for an executable. Names containing '/' are checked as-is.
[[nodiscard]] std::optional<std::string> find_executable(std::string_view name);

// Muxes a video-only and an audio-only file into one container with ffmpeg,
// copying both streams without re-encoding.
class Merger {
public:
    explicit Merger(std::string ffmpeg = "ffmpeg", ProcessRunner runner = run_process);

    [[nodiscard]] std::error_code merge(const std::string& video_file,
                                        const std::string& audio_file,
                                        const std::string& output_file) const;

    [[nodiscard]] std::vector<std::string> command_line(const std::string& video_file,
                                                        const std::string& audio_file,
                                                        const std::string& output_file) const;

    [[nodiscard]] const std::string& ffmpeg() const noexcept { return ffmpeg_; }

private:
    std::string ffmpeg_;
    ProcessRunner runner_;
};

} // namespace dashgrab::media
