// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace dashgrab::core {

enum class DownloadErrc {
    success = 0,
    invalid_url,
    http_status,
    network_error,
    timeout,
    refused,
    dns_error,
    ssl_error,
    too_many_redirects,
    cancelled,
    manifest_invalid,
    no_video_stream,
    no_audio_stream,
    merge_failed,
    dependency_missing,
    config_invalid,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "dashgrab::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:              return "Success";
            case DownloadErrc::invalid_url:          return "Invalid URL";
            case DownloadErrc::http_status:          return "Unexpected HTTP status";
            case DownloadErrc::network_error:        return "Network error";
            case DownloadErrc::timeout:              return "Operation timed out";
            case DownloadErrc::refused:              return "Connection refused";
            case DownloadErrc::dns_error:            return "DNS resolution failed";
            case DownloadErrc::ssl_error:            return "SSL/TLS error";
            case DownloadErrc::too_many_redirects:   return "Too many redirects";
            case DownloadErrc::cancelled:            return "Download cancelled";
            case DownloadErrc::manifest_invalid:     return "Invalid manifest";
            case DownloadErrc::no_video_stream:      return "No video representation found";
            case DownloadErrc::no_audio_stream:      return "No audio representation found";
            case DownloadErrc::merge_failed:         return "ffmpeg merge failed";
            case DownloadErrc::dependency_missing:   return "Required dependency not found";
            case DownloadErrc::config_invalid:       return "Invalid configuration";
            default:                                 return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace dashgrab::core

namespace std {

template<>
struct is_error_code_enum<dashgrab::core::DownloadErrc> : true_type {};

} // namespace std
