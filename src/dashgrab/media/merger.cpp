// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/media/merger.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace dashgrab::media {

std::expected<int, std::error_code> run_process(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return std::unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int rc = ::posix_spawnp(&pid, args[0], nullptr, nullptr, args.data(), environ);
    if (rc != 0) {
        return std::unexpected(std::error_code(rc, std::generic_category()));
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::unexpected(std::error_code(errno, std::generic_category()));
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    // Killed by a signal
    return 128 + WTERMSIG(status);
}

std::optional<std::string> find_executable(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        std::string path(name);
        if (::access(path.c_str(), X_OK) == 0) {
            return path;
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string_view dirs(path_env);
    while (true) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        if (dir.empty()) {
            dir = ".";
        }

        auto candidate = (std::filesystem::path(dir) / std::string(name)).string();
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }

        if (sep == std::string_view::npos) break;
        dirs.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

//=============================================================================
// Merger
//=============================================================================

Merger::Merger(std::string ffmpeg, ProcessRunner runner)
    : ffmpeg_(std::move(ffmpeg))
    , runner_(std::move(runner)) {}

std::vector<std::string> Merger::command_line(const std::string& video_file,
                                              const std::string& audio_file,
                                              const std::string& output_file) const {
    return {
        ffmpeg_,
        "-y",                 // Overwrite output file
        "-i", video_file,
        "-i", audio_file,
        "-c:v", "copy",
        "-c:a", "copy",
        output_file,
    };
}

std::error_code Merger::merge(const std::string& video_file,
                              const std::string& audio_file,
                              const std::string& output_file) const {
    spdlog::info("Merging video: {} and audio: {} to {}", video_file, audio_file, output_file);

    auto status = runner_(command_line(video_file, audio_file, output_file));
    if (!status) {
        spdlog::error("Failed to start {}: {}", ffmpeg_, status.error().message());
        return make_error_code(core::DownloadErrc::merge_failed);
    }
    if (*status != 0) {
        spdlog::error("{} exited with status {}", ffmpeg_, *status);
        return make_error_code(core::DownloadErrc::merge_failed);
    }
    return {};
}

} // namespace dashgrab::media
