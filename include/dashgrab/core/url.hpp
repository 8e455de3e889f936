// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace dashgrab::core {

// Absolute URL split into its RFC 3986 components
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view userinfo() const noexcept { return userinfo_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }
    [[nodiscard]] std::string_view fragment() const noexcept { return fragment_; }
    [[nodiscard]] bool has_query() const noexcept { return has_query_; }
    [[nodiscard]] bool has_fragment() const noexcept { return has_fragment_; }

    [[nodiscard]] std::string full() const;
    [[nodiscard]] std::string authority() const;
    [[nodiscard]] std::string base() const;  // scheme://host[:port]
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    // Resolve a relative or absolute reference against this URL (RFC 3986 5.2).
    // A reference carrying a path replaces this URL's query instead of merging.
    [[nodiscard]] std::expected<Url, std::error_code>
    resolve(std::string_view reference) const noexcept;

    Url() = default;

private:
    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    bool has_query_{false};
    bool has_fragment_{false};
};

// Resolve `reference` against `base` and return the absolute URL string.
// Pure: no I/O and no shared state, safe to call from any thread.
[[nodiscard]] std::expected<std::string, std::error_code>
resolve_url(std::string_view base, std::string_view reference) noexcept;

// Remove "." and ".." segments from a path (RFC 3986 5.2.4)
[[nodiscard]] std::string remove_dot_segments(std::string_view path);

} // namespace dashgrab::core
