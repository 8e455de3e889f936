// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/core/http_session.hpp>
#include <dashgrab/version.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <format>

namespace dashgrab::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct Transfer {
    Payload* body{nullptr};
    std::stop_token stoken;
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) noexcept {
    auto* transfer = static_cast<Transfer*>(userdata);
    if (!transfer || !transfer->body) return 0;

    std::size_t total = size * nitems;
    const std::size_t offset = transfer->body->size();

    try {
        transfer->body->resize(offset + total);
    } catch (const std::bad_alloc&) {
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    std::memcpy(transfer->body->data() + offset, ptr, total);
    return total;
}

// libcurl progress callback - aborts the transfer once stop is requested
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* transfer = static_cast<Transfer*>(userdata);
    return transfer->stoken.stop_requested() ? 1 : 0;
}

std::error_code map_curl_error(CURLcode code) noexcept {
    switch (code) {
        case CURLE_ABORTED_BY_CALLBACK:
            return make_error_code(DownloadErrc::cancelled);
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return make_error_code(DownloadErrc::dns_error);
        case CURLE_COULDNT_CONNECT:
            return make_error_code(DownloadErrc::refused);
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(DownloadErrc::timeout);
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_CACERT_BADFILE:
            return make_error_code(DownloadErrc::ssl_error);
        case CURLE_TOO_MANY_REDIRECTS:
            return make_error_code(DownloadErrc::too_many_redirects);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return make_error_code(DownloadErrc::invalid_url);
        default:
            return make_error_code(DownloadErrc::network_error);
    }
}

} // namespace

std::string FetchError::message() const {
    if (is_status()) {
        return std::format("HTTP status {}", status_code);
    }
    return code.message();
}

//=============================================================================
// HttpSession
//=============================================================================

HttpSession::HttpSession(HttpOptions options) noexcept
    : options_(options) {}

std::expected<HttpResponse, FetchError>
HttpSession::get(const std::string& url, std::stop_token stoken) noexcept {
    if (stoken.stop_requested()) {
        return std::unexpected(FetchError{make_error_code(DownloadErrc::cancelled)});
    }

    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(FetchError{make_error_code(DownloadErrc::network_error)});
    }

    HttpResponse response{};
    Transfer transfer{&response.body, stoken};
    const std::string user_agent = "dashgrab/" + dashgrab::version.to_string();

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);

    // Set callbacks
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);  // Enable progress callback

    // Timeouts
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(options_.connect_timeout_sec));
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_LOW_SPEED_TIME, static_cast<long>(options_.stall_timeout_sec));

    // SSL options
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);

    if constexpr (FOLLOW_REDIRECTS) {
        curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(MAX_REDIRECTS));
    }

    // HTTP/2
    curl_easy_setopt(curl.ptr, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(READ_BUFFER_SIZE));

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        auto ec = map_curl_error(result);
        if (ec != DownloadErrc::cancelled) {
            spdlog::debug("GET {} failed: {}", url, curl_easy_strerror(result));
        }
        return std::unexpected(FetchError{ec});
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    response.status_code = static_cast<std::int32_t>(http_code);

    char* ct = nullptr;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
        response.content_type = ct;
    }

    char* effective = nullptr;
    if (curl_easy_getinfo(curl.ptr, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective) {
        response.effective_url = effective;
    }

    if (http_code < 200 || http_code >= 300) {
        return std::unexpected(FetchError{make_error_code(DownloadErrc::http_status),
                                          response.status_code});
    }

    return response;
}

std::expected<Payload, FetchError>
HttpSession::fetch(std::stop_token stoken, const std::string& url) {
    auto response = get(url, std::move(stoken));
    if (!response) {
        return std::unexpected(response.error());
    }
    return std::move(response->body);
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void HttpSession::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpSession::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace dashgrab::core
