// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/core/config.hpp>
#include <dashgrab/core/error.hpp>
#include <dashgrab/core/http_session.hpp>
#include <dashgrab/core/segment.hpp>
#include <dashgrab/disk/file_writer.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>

namespace dashgrab::core {

// Orchestrator state machine
enum class DownloadState : std::uint8_t {
    idle,        // Not started
    init,        // Fetching the initialization segment
    dispatching, // Starting workers over the pre-loaded queue
    draining,    // Collecting results and writing them in order
    completed,   // All segments written
    failed,      // Aborted by an error
    cancelled    // Aborted by the caller
};

// Where a stream download stopped
enum class FailureStage : std::uint8_t {
    address,        // A segment URL could not be resolved
    init_segment,   // Initialization segment fetch failed
    media_segment,  // A media segment fetch failed
    sink,           // Temp file creation or write failed
    cancelled       // Stop was requested
};

struct StreamError {
    FailureStage stage{FailureStage::media_segment};
    std::int64_t segment_index{-1};   // -1 when no media segment is involved
    std::error_code code;
    std::int32_t http_status{0};

    [[nodiscard]] bool cancelled() const noexcept { return stage == FailureStage::cancelled; }
    [[nodiscard]] std::string message() const;
};

struct StreamProgress {
    std::int64_t segments_written{0};
    std::int64_t total_segments{0};
    std::uint64_t bytes_written{0};
};

using StreamProgressCallback = std::function<void(const StreamProgress&)>;

struct DownloaderOptions {
    std::uint32_t workers{DEFAULT_WORKERS};
    std::filesystem::path temp_dir;   // Empty: system temp directory
};

// Downloads one representation: the init segment first, then every media
// segment through a fixed worker pool. Segments reach the sink strictly in
// index order, whatever order the fetches complete in. The first failed
// segment aborts the whole stream.
class StreamDownloader {
public:
    explicit StreamDownloader(SegmentFetcher& fetcher, DownloaderOptions options = {}) noexcept;

    // Non-copyable, non-movable (atomic members can't be moved)
    StreamDownloader(const StreamDownloader&) = delete;
    StreamDownloader& operator=(const StreamDownloader&) = delete;

    // Download into a new temporary file and return its path. On any
    // failure the temporary file is removed.
    [[nodiscard]] std::expected<std::filesystem::path, StreamError>
    download(const StreamDescriptor& stream,
             std::string_view base_url,
             double total_duration_secs,
             std::stop_token stoken = {});

    // Download into a caller-owned sink. Returns the number of media
    // segments written.
    [[nodiscard]] std::expected<std::int64_t, StreamError>
    download_into(disk::Sink& sink,
                  const StreamDescriptor& stream,
                  std::string_view base_url,
                  double total_duration_secs,
                  std::stop_token stoken = {});

    // Called on the collecting thread after every sink write
    void callback(StreamProgressCallback cb) noexcept { callback_ = std::move(cb); }

    [[nodiscard]] DownloadState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const DownloaderOptions& options() const noexcept { return options_; }

private:
    // Fan the media segments out to the pool and write them back in order
    [[nodiscard]] std::expected<std::int64_t, StreamError>
    download_segments(disk::Sink& sink,
                      const SegmentTemplate& tmpl,
                      std::string_view base_url,
                      std::int64_t segment_count,
                      std::stop_token stoken);

    [[nodiscard]] std::unexpected<StreamError> fail(StreamError error) noexcept;

    void state(DownloadState new_state) noexcept { state_.store(new_state, std::memory_order_release); }

    SegmentFetcher& fetcher_;
    DownloaderOptions options_;
    StreamProgressCallback callback_;
    std::atomic<DownloadState> state_{DownloadState::idle};
};

} // namespace dashgrab::core
