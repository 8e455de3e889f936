// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/media/dash_parser.hpp>
#include <dashgrab/media/merger.hpp>
#include <dashgrab/core/http_session.hpp>
#include <dashgrab/core/stream_downloader.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace dashgrab::media {

// Media download progress for one of the two streams
struct MediaProgress {
    std::string_view stream;          // "video" or "audio"
    std::int64_t segments_downloaded{0};
    std::int64_t total_segments{0};
    std::uint64_t downloaded_bytes{0};
};

using MediaProgressCallback = std::function<void(const MediaProgress&)>;

// Downloads a DASH presentation: selects one video and one audio
// representation, fetches both through StreamDownloader and muxes them.
class MediaDownloader {
public:
    MediaDownloader(core::SegmentFetcher& fetcher,
                    Merger merger,
                    core::DownloaderOptions options = {});

    // Non-copyable
    MediaDownloader(const MediaDownloader&) = delete;
    MediaDownloader& operator=(const MediaDownloader&) = delete;

    // Download and parse manifest
    [[nodiscard]] std::error_code fetch_manifest(const std::string& url,
                                                 std::stop_token stoken = {});

    // Download the selected streams and merge them into output_path.
    // Temporary stream files are removed on every path.
    [[nodiscard]] std::error_code download_dash(const std::string& output_path,
                                                std::uint32_t target_height,
                                                std::stop_token stoken = {});

    // Set progress callback
    void callback(MediaProgressCallback cb) noexcept { callback_ = std::move(cb); }

    [[nodiscard]] const DASHManifest& dash_manifest() const noexcept { return dash_manifest_; }
    [[nodiscard]] const std::string& manifest_url() const noexcept { return manifest_url_; }

    // Human-readable description of the last failure
    [[nodiscard]] const std::string& error_detail() const noexcept { return error_detail_; }

private:
    [[nodiscard]] std::expected<std::filesystem::path, core::StreamError>
    download_stream(const DASHRepresentation& rep,
                    std::string_view label,
                    std::stop_token stoken);

    core::SegmentFetcher& fetcher_;
    Merger merger_;
    core::DownloaderOptions options_;
    MediaProgressCallback callback_;

    DASHManifest dash_manifest_;
    std::string manifest_url_;
    std::string error_detail_;
};

} // namespace dashgrab::media
