// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/core/error.hpp>
#include <dashgrab/core/config.hpp>
#include <dashgrab/core/segment.hpp>
#include <cstdint>
#include <string>
#include <expected>
#include <stop_token>

namespace dashgrab::core {

// Failure of a single GET. status_code is set only for non-2xx responses
// (code == DownloadErrc::http_status); transport failures leave it at 0.
struct FetchError {
    std::error_code code;
    std::int32_t status_code{0};

    [[nodiscard]] bool is_status() const noexcept { return status_code != 0; }
    [[nodiscard]] std::string message() const;
};

struct HttpResponse {
    std::int32_t status_code{0};
    std::string content_type;
    std::string effective_url;   // After redirects
    Payload body;
};

struct HttpOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t stall_timeout_sec{STALL_TIMEOUT_SEC};
};

// Fetches one resource in full. Implementations must be safe to call
// concurrently from several threads.
class SegmentFetcher {
public:
    virtual ~SegmentFetcher() = default;

    [[nodiscard]] virtual std::expected<Payload, FetchError>
    fetch(std::stop_token stoken, const std::string& url) = 0;
};

// libcurl-backed fetcher. Every request uses its own easy handle, so one
// session may be shared by all workers.
class HttpSession final : public SegmentFetcher {
public:
    explicit HttpSession(HttpOptions options = {}) noexcept;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    // Perform GET request, reading the whole body. The transfer aborts
    // with DownloadErrc::cancelled as soon as stop is requested.
    [[nodiscard]] std::expected<HttpResponse, FetchError>
    get(const std::string& url, std::stop_token stoken = {}) noexcept;

    [[nodiscard]] std::expected<Payload, FetchError>
    fetch(std::stop_token stoken, const std::string& url) override;

    [[nodiscard]] const HttpOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup, before any thread starts)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpOptions options_;
};

} // namespace dashgrab::core
