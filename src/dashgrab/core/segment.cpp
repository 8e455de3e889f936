// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/core/segment.hpp>
#include <dashgrab/core/config.hpp>
#include <cmath>
#include <limits>

namespace dashgrab::core {

namespace {

std::string replace_all(std::string_view pattern, std::string_view token, std::string_view value) {
    std::string result;
    result.reserve(pattern.size());

    std::size_t pos = 0;
    while (true) {
        auto found = pattern.find(token, pos);
        if (found == std::string_view::npos) {
            result.append(pattern.substr(pos));
            break;
        }
        result.append(pattern.substr(pos, found - pos));
        result.append(value);
        pos = found + token.size();
    }
    return result;
}

} // namespace

double SegmentTemplate::duration_seconds() const noexcept {
    if (timescale <= 0) {
        return 0.0;
    }
    return static_cast<double>(duration) / static_cast<double>(timescale);
}

std::int64_t estimate_segment_count(double total_duration_secs,
                                    const SegmentTemplate& tmpl) noexcept {
    const double seg_duration = tmpl.duration_seconds();
    if (!(total_duration_secs > 0.0) || !(seg_duration > 0.0)) {
        return 0;
    }

    // Manifest-controlled; must fit in an int64 before the cast
    const double quotient = std::floor(total_duration_secs / seg_duration);
    constexpr auto limit = static_cast<double>(std::numeric_limits<std::int64_t>::max());
    if (!std::isfinite(quotient) || quotient >= limit) {
        return 0;
    }
    return static_cast<std::int64_t>(quotient) + 1;
}

std::string expand_media_path(std::string_view pattern, std::int64_t index) {
    return replace_all(pattern, NUMBER_PLACEHOLDER, std::to_string(index));
}

std::string expand_representation_id(std::string_view pattern, std::string_view id) {
    return replace_all(pattern, REPRESENTATION_PLACEHOLDER, id);
}

} // namespace dashgrab::core
