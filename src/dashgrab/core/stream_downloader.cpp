// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/core/stream_downloader.hpp>
#include <dashgrab/core/channel.hpp>
#include <dashgrab/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <format>
#include <map>
#include <thread>
#include <vector>

namespace dashgrab::core {

namespace {

std::string describe_cause(const std::error_code& code, std::int32_t http_status) {
    if (http_status != 0) {
        return std::format("HTTP status {}", http_status);
    }
    return code.message();
}

// Stream ids come from the manifest; keep only filename-safe characters
std::string temp_prefix(std::string_view stream_id) {
    std::string prefix = "stream-";
    for (char c : stream_id) {
        auto uc = static_cast<unsigned char>(c);
        prefix += (std::isalnum(uc) || c == '-' || c == '_') ? c : '_';
    }
    prefix += "-";
    return prefix;
}

} // namespace

std::string StreamError::message() const {
    switch (stage) {
        case FailureStage::address:
            if (segment_index >= 0) {
                return std::format("failed to resolve url for segment {}: {}", segment_index, code.message());
            }
            return std::format("failed to resolve init segment url: {}", code.message());
        case FailureStage::init_segment:
            return std::format("failed to download init segment: {}", describe_cause(code, http_status));
        case FailureStage::media_segment:
            return std::format("failed to download segment {}: {}", segment_index, describe_cause(code, http_status));
        case FailureStage::sink:
            if (segment_index >= 0) {
                return std::format("failed to write segment {} to file: {}", segment_index, code.message());
            }
            return std::format("failed to write output file: {}", code.message());
        case FailureStage::cancelled:
            return "download cancelled";
    }
    return code.message();
}

//=============================================================================
// StreamDownloader
//=============================================================================

StreamDownloader::StreamDownloader(SegmentFetcher& fetcher, DownloaderOptions options) noexcept
    : fetcher_(fetcher)
    , options_(std::move(options)) {
    if (options_.workers == 0) {
        options_.workers = 1;
    }
}

std::unexpected<StreamError> StreamDownloader::fail(StreamError error) noexcept {
    state(error.cancelled() ? DownloadState::cancelled : DownloadState::failed);
    return std::unexpected(std::move(error));
}

std::expected<std::filesystem::path, StreamError>
StreamDownloader::download(const StreamDescriptor& stream,
                           std::string_view base_url,
                           double total_duration_secs,
                           std::stop_token stoken) {
    std::error_code ec;
    std::filesystem::path dir = options_.temp_dir;
    if (dir.empty()) {
        dir = std::filesystem::temp_directory_path(ec);
        if (ec) {
            return fail({FailureStage::sink, -1, ec});
        }
    }

    auto writer = disk::FileWriter::create_temp(dir, temp_prefix(stream.id), ".mp4");
    if (!writer) {
        return fail({FailureStage::sink, -1, writer.error()});
    }

    // The writer removes its file on every early return below
    auto written = download_into(*writer, stream, base_url, total_duration_secs, stoken);
    if (!written) {
        return std::unexpected(written.error());
    }

    if (auto commit_ec = writer->commit()) {
        return fail({FailureStage::sink, -1, commit_ec});
    }

    spdlog::info("Download complete: {} ({} bytes)", writer->path().string(), writer->bytes_written());
    return writer->path();
}

std::expected<std::int64_t, StreamError>
StreamDownloader::download_into(disk::Sink& sink,
                                const StreamDescriptor& stream,
                                std::string_view base_url,
                                double total_duration_secs,
                                std::stop_token stoken) {
    const auto& tmpl = stream.segment_template;
    state(DownloadState::init);

    spdlog::info("Starting download for stream: {} (bandwidth: {})", stream.id, stream.bandwidth);

    if (stoken.stop_requested()) {
        return fail({FailureStage::cancelled, -1, make_error_code(DownloadErrc::cancelled)});
    }

    // 1. Initialization segment, synchronously
    auto init_url = resolve_url(base_url, tmpl.initialization);
    if (!init_url) {
        return fail({FailureStage::address, -1, init_url.error()});
    }

    spdlog::info("Downloading init segment: {}", *init_url);
    auto init = fetcher_.fetch(stoken, *init_url);
    if (!init) {
        if (stoken.stop_requested() || init.error().code == DownloadErrc::cancelled) {
            return fail({FailureStage::cancelled, -1, make_error_code(DownloadErrc::cancelled)});
        }
        return fail({FailureStage::init_segment, -1, init.error().code, init.error().status_code});
    }

    if (auto ec = sink.append(*init)) {
        return fail({FailureStage::sink, -1, ec});
    }

    // 2. Media segments
    const auto segment_count = estimate_segment_count(total_duration_secs, tmpl);
    spdlog::info("Estimated segments: {} (Segment Duration: {:.2f}s)",
                 segment_count, tmpl.duration_seconds());

    if (segment_count == 0) {
        if (total_duration_secs > 0.0 && tmpl.duration_seconds() > 0.0) {
            spdlog::warn("Segment estimate out of range for duration {}s, writing init segment only",
                         total_duration_secs);
        }
        if (stoken.stop_requested()) {
            return fail({FailureStage::cancelled, -1, make_error_code(DownloadErrc::cancelled)});
        }
        state(DownloadState::completed);
        return 0;
    }

    return download_segments(sink, tmpl, base_url, segment_count, stoken);
}

std::expected<std::int64_t, StreamError>
StreamDownloader::download_segments(disk::Sink& sink,
                                    const SegmentTemplate& tmpl,
                                    std::string_view base_url,
                                    std::int64_t segment_count,
                                    std::stop_token stoken) {
    // One stop source for this download: fired by the caller's token or by
    // the collector on the first failure
    std::stop_source abort;
    std::stop_callback forward(stoken, [&abort] { abort.request_stop(); });
    const std::stop_token token = abort.get_token();

    const std::int64_t start = tmpl.start_number;
    const std::int64_t end = start + segment_count;

    Channel<std::int64_t> jobs(static_cast<std::size_t>(segment_count));
    Channel<SegmentResult> results(static_cast<std::size_t>(segment_count));

    // Pre-load every index, then close: nothing is ever added later
    for (std::int64_t index = start; index < end; ++index) {
        if (!jobs.push(index)) {
            break;
        }
    }
    jobs.close();

    const auto worker_count = static_cast<std::uint32_t>(
        std::min<std::int64_t>(options_.workers, segment_count));
    std::atomic<std::uint32_t> active{worker_count};

    auto worker = [&] {
        while (!token.stop_requested()) {
            auto index = jobs.pop(token);
            if (!index || token.stop_requested()) {
                break;
            }

            SegmentResult result{*index};
            auto url = resolve_url(base_url, expand_media_path(tmpl.media, *index));
            if (!url) {
                result.error = url.error();
            } else {
                spdlog::debug("Fetching segment {}: {}", *index, *url);
                auto body = fetcher_.fetch(token, *url);
                if (body) {
                    result.payload = std::move(*body);
                } else {
                    result.error = body.error().code;
                    result.http_status = body.error().status_code;
                }
            }

            // A cancelled worker exits without publishing
            if (token.stop_requested() || !results.push(std::move(result), token)) {
                break;
            }
        }

        // Last worker out closes the results channel
        if (active.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            results.close();
        }
    };

    state(DownloadState::dispatching);

    // Declared last so the threads are joined before the channels go away
    std::vector<std::jthread> pool;
    pool.reserve(worker_count);
    for (std::uint32_t i = 0; i < worker_count; ++i) {
        pool.emplace_back(worker);
    }

    // Stop the workers before the pool joins them, however the collector exits
    struct StopOnExit {
        std::stop_source& source;
        ~StopOnExit() { source.request_stop(); }
    } stop_on_exit{abort};

    state(DownloadState::draining);

    // Segments that arrived ahead of the write cursor
    std::map<std::int64_t, Payload> pending;
    std::int64_t next_to_write = start;
    std::uint64_t bytes_written = 0;

    while (true) {
        auto result = results.pop(token);
        if (!result || token.stop_requested()) {
            break;
        }

        if (result->error) {
            abort.request_stop();
            const auto stage = result->error == DownloadErrc::invalid_url
                ? FailureStage::address
                : FailureStage::media_segment;
            spdlog::warn("Failed to download segment {}: {}", result->index,
                         describe_cause(result->error, result->http_status));
            return fail({stage, result->index, result->error, result->http_status});
        }

        pending.emplace(result->index, std::move(result->payload));

        // Write all available consecutive segments
        for (auto it = pending.find(next_to_write); it != pending.end(); it = pending.find(next_to_write)) {
            if (auto ec = sink.append(it->second)) {
                abort.request_stop();
                return fail({FailureStage::sink, next_to_write, ec});
            }
            bytes_written += it->second.size();
            pending.erase(it);
            ++next_to_write;

            if (callback_) {
                callback_(StreamProgress{next_to_write - start, segment_count, bytes_written});
            }
        }
    }

    if (token.stop_requested()) {
        abort.request_stop();
        return fail({FailureStage::cancelled, -1, make_error_code(DownloadErrc::cancelled)});
    }

    if (next_to_write != end || !pending.empty()) {
        spdlog::warn("Segment estimate inconsistent: wrote up to {} of {}, {} segment(s) left unwritten",
                     next_to_write, end, pending.size());
    }

    state(DownloadState::completed);
    return next_to_write - start;
}

} // namespace dashgrab::core
