// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <optional>

namespace dashgrab::core {

namespace {

// Generic URI reference split (RFC 3986 Appendix B). Components that are
// absent stay nullopt; an empty-but-present query ("a?") is an empty view.
struct Reference {
    std::optional<std::string_view> scheme;
    std::optional<std::string_view> authority;
    std::string_view path;
    std::optional<std::string_view> query;
    std::optional<std::string_view> fragment;
};

bool has_control_chars(std::string_view s) noexcept {
    return std::any_of(s.begin(), s.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return uc < 0x20 || uc == 0x7f;
    });
}

bool is_scheme(std::string_view s) noexcept {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '+' || c == '-' || c == '.';
    });
}

Reference split_reference(std::string_view s) noexcept {
    Reference ref;

    // Scheme ends at the first ':' that precedes any of "/?#"
    auto delim = s.find_first_of(":/?#");
    if (delim != std::string_view::npos && s[delim] == ':' && is_scheme(s.substr(0, delim))) {
        ref.scheme = s.substr(0, delim);
        s.remove_prefix(delim + 1);
    }

    if (s.starts_with("//")) {
        s.remove_prefix(2);
        auto auth_end = std::min(s.find_first_of("/?#"), s.size());
        ref.authority = s.substr(0, auth_end);
        s.remove_prefix(auth_end);
    }

    auto fragment_start = s.find('#');
    if (fragment_start != std::string_view::npos) {
        ref.fragment = s.substr(fragment_start + 1);
        s = s.substr(0, fragment_start);
    }

    auto query_start = s.find('?');
    if (query_start != std::string_view::npos) {
        ref.query = s.substr(query_start + 1);
        s = s.substr(0, query_start);
    }

    ref.path = s;
    return ref;
}

// Merge a relative path with the base path (RFC 3986 5.2.3)
std::string merge_paths(const Url& base, std::string_view relative) {
    if (!base.host().empty() && base.path().empty()) {
        std::string merged = "/";
        merged += relative;
        return merged;
    }

    auto base_path = base.path();
    auto last_slash = base_path.rfind('/');
    if (last_slash == std::string_view::npos) {
        return std::string(relative);
    }

    std::string merged(base_path.substr(0, last_slash + 1));
    merged += relative;
    return merged;
}

} // namespace

std::string remove_dot_segments(std::string_view path) {
    std::string input(path);
    std::string output;
    output.reserve(input.size());

    auto drop_last_segment = [&output] {
        auto last_slash = output.rfind('/');
        output.erase(last_slash == std::string::npos ? 0 : last_slash);
    };

    while (!input.empty()) {
        if (input.starts_with("../")) {
            input.erase(0, 3);
        } else if (input.starts_with("./")) {
            input.erase(0, 2);
        } else if (input.starts_with("/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (input.starts_with("/../")) {
            input.erase(0, 3);
            drop_last_segment();
        } else if (input == "/..") {
            input = "/";
            drop_last_segment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            // Move the first segment, including its leading '/', to the output
            auto next = input.find('/', input.front() == '/' ? 1 : 0);
            if (next == std::string::npos) {
                next = input.size();
            }
            output.append(input, 0, next);
            input.erase(0, next);
        }
    }

    return output;
}

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    if (url_str.empty() || has_control_chars(url_str)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto ref = split_reference(url_str);
    if (!ref.scheme || !ref.authority) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    Url url;

    // Convert scheme to lowercase and store
    url.scheme_.reserve(ref.scheme->size());
    for (char c : *ref.scheme) {
        url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    std::string_view authority = *ref.authority;

    // Check for userinfo @ notation (user:pass@host:port)
    auto at_pos = authority.rfind('@');
    if (at_pos != std::string_view::npos) {
        url.userinfo_ = std::string(authority.substr(0, at_pos));
        authority.remove_prefix(at_pos + 1);
    }

    std::string_view port;
    if (authority.starts_with('[')) {
        // IPv6 address in brackets [::1]:port
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        url.host_ = std::string(authority.substr(0, bracket_end + 1));
        auto after = authority.substr(bracket_end + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            port = after.substr(1);
        }
    } else {
        auto colon_pos = authority.rfind(':');
        if (colon_pos != std::string_view::npos) {
            port = authority.substr(colon_pos + 1);
            authority = authority.substr(0, colon_pos);
        }
        url.host_ = std::string(authority);
    }

    if (!std::all_of(port.begin(), port.end(),
                     [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }
    url.port_ = std::string(port);

    // Validate that we got a usable host
    if (url.host_.empty() ||
        std::any_of(url.host_.begin(), url.host_.end(),
                    [](char c) { return c == ' ' || c == '\\' || c == '<' || c == '>'; })) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    url.path_ = std::string(ref.path);
    if (ref.query) {
        url.has_query_ = true;
        url.query_ = std::string(*ref.query);
    }
    if (ref.fragment) {
        url.has_fragment_ = true;
        url.fragment_ = std::string(*ref.fragment);
    }

    return url;
}

std::expected<Url, std::error_code> Url::resolve(std::string_view reference) const noexcept {
    if (has_control_chars(reference)) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_url));
    }

    auto ref = split_reference(reference);

    // Reference already absolute: only normalize its path
    if (ref.scheme) {
        auto absolute = Url::parse(reference);
        if (!absolute) {
            return absolute;
        }
        absolute->path_ = remove_dot_segments(absolute->path_);
        return absolute;
    }

    std::string target = scheme_;
    target += ":";

    if (ref.authority) {
        // Network-path reference (//host/path)
        target += "//";
        target += *ref.authority;
        target += remove_dot_segments(ref.path);
        if (ref.query) {
            target += "?";
            target += *ref.query;
        }
    } else {
        target += "//";
        target += authority();

        if (ref.path.empty()) {
            target += path_;
            if (ref.query) {
                target += "?";
                target += *ref.query;
            } else if (has_query_) {
                target += "?";
                target += query_;
            }
        } else {
            if (ref.path.starts_with('/')) {
                target += remove_dot_segments(ref.path);
            } else {
                target += remove_dot_segments(merge_paths(*this, ref.path));
            }
            if (ref.query) {
                target += "?";
                target += *ref.query;
            }
        }
    }

    if (ref.fragment) {
        target += "#";
        target += *ref.fragment;
    }

    return Url::parse(target);
}

std::string Url::authority() const {
    std::string result;
    if (!userinfo_.empty()) {
        result += userinfo_;
        result += "@";
    }
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::string Url::full() const {
    std::string result = scheme_;
    result += "://";
    result += authority();
    result += path_;
    if (has_query_) {
        result += "?";
        result += query_;
    }
    if (has_fragment_) {
        result += "#";
        result += fragment_;
    }
    return result;
}

std::string Url::base() const {
    std::string result = scheme_;
    result += "://";
    result += host_;
    if (!port_.empty()) {
        result += ":";
        result += port_;
    }
    return result;
}

std::expected<std::string, std::error_code>
resolve_url(std::string_view base, std::string_view reference) noexcept {
    auto base_url = Url::parse(base);
    if (!base_url) {
        return std::unexpected(base_url.error());
    }

    auto resolved = base_url->resolve(reference);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    return resolved->full();
}

} // namespace dashgrab::core
