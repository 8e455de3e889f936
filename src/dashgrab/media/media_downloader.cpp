// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/media/media_downloader.hpp>
#include <dashgrab/core/error.hpp>
#include <spdlog/spdlog.h>
#include <format>

namespace dashgrab::media {

namespace {

// Removes a temporary stream file when it goes out of scope
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) noexcept : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (path_.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove temporary file {}: {}", path_.string(), ec.message());
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

//=============================================================================
// MediaDownloader
//=============================================================================

MediaDownloader::MediaDownloader(core::SegmentFetcher& fetcher,
                                 Merger merger,
                                 core::DownloaderOptions options)
    : fetcher_(fetcher)
    , merger_(std::move(merger))
    , options_(std::move(options)) {}

std::error_code MediaDownloader::fetch_manifest(const std::string& url, std::stop_token stoken) {
    spdlog::info("Fetching manifest from: {}", url);

    auto body = fetcher_.fetch(stoken, url);
    if (!body) {
        error_detail_ = std::format("failed to fetch manifest: {}", body.error().message());
        return body.error().code;
    }

    std::string_view content(reinterpret_cast<const char*>(body->data()), body->size());
    auto manifest = DASHParser::parse(content);
    if (!manifest) {
        error_detail_ = std::format("failed to parse manifest: {}", manifest.error().message());
        return manifest.error();
    }

    dash_manifest_ = std::move(*manifest);
    manifest_url_ = url;
    return {};
}

std::expected<std::filesystem::path, core::StreamError>
MediaDownloader::download_stream(const DASHRepresentation& rep,
                                 std::string_view label,
                                 std::stop_token stoken) {
    core::StreamDownloader downloader(fetcher_, options_);
    if (callback_) {
        downloader.callback([this, label](const core::StreamProgress& p) {
            callback_(MediaProgress{label, p.segments_written, p.total_segments, p.bytes_written});
        });
    }
    return downloader.download(rep.descriptor(), manifest_url_, dash_manifest_.duration_seconds, stoken);
}

std::error_code MediaDownloader::download_dash(const std::string& output_path,
                                               std::uint32_t target_height,
                                               std::stop_token stoken) {
    if (manifest_url_.empty()) {
        error_detail_ = "no manifest loaded";
        return make_error_code(core::DownloadErrc::manifest_invalid);
    }

    auto video = dash_manifest_.select_video(target_height);
    if (!video) {
        error_detail_ = std::format("error selecting video stream: {}", video.error().message());
        return video.error();
    }
    spdlog::info("Selected video stream: ID={}, Bandwidth={}, Height={} (Requested: {}p)",
                 video->id, video->bandwidth, video->height, target_height);

    auto audio = dash_manifest_.select_audio();
    if (!audio) {
        error_detail_ = std::format("error selecting audio stream: {}", audio.error().message());
        return audio.error();
    }
    spdlog::info("Selected audio stream: ID={}, Bandwidth={}", audio->id, audio->bandwidth);

    auto video_file = download_stream(*video, "video", stoken);
    if (!video_file) {
        error_detail_ = std::format("error downloading video: {}", video_file.error().message());
        return video_file.error().cancelled()
            ? make_error_code(core::DownloadErrc::cancelled)
            : video_file.error().code;
    }
    TempFileGuard video_guard(*video_file);

    auto audio_file = download_stream(*audio, "audio", stoken);
    if (!audio_file) {
        error_detail_ = std::format("error downloading audio: {}", audio_file.error().message());
        return audio_file.error().cancelled()
            ? make_error_code(core::DownloadErrc::cancelled)
            : audio_file.error().code;
    }
    TempFileGuard audio_guard(*audio_file);

    if (auto ec = merger_.merge(video_guard.path().string(), audio_guard.path().string(), output_path)) {
        error_detail_ = std::format("error combining video and audio: {}", ec.message());
        return ec;
    }

    return {};
}

} // namespace dashgrab::media
