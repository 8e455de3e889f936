// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dashgrab::core {

// Raw bytes of one fetched segment
using Payload = std::vector<std::byte>;

// DASH SegmentTemplate addressing for one representation
struct SegmentTemplate {
    std::string initialization;   // Init segment path, relative or absolute
    std::string media;            // Media path pattern containing $Number$
    std::int64_t start_number{0};
    std::int64_t duration{0};     // In timescale units
    std::int64_t timescale{0};

    // Segment duration in seconds; 0 when the timescale is unusable
    [[nodiscard]] double duration_seconds() const noexcept;
};

// One encoding variant selected for download
struct StreamDescriptor {
    std::string id;
    std::uint64_t bandwidth{0};   // Informational only
    SegmentTemplate segment_template;
};

// Outcome of fetching one media segment. Produced exactly once per
// dispatched index.
struct SegmentResult {
    std::int64_t index{0};
    Payload payload;
    std::error_code error;
    std::int32_t http_status{0};
};

// Number of media segments implied by the total duration. One extra
// segment is added when both durations are positive to absorb rounding
// and a trailing short segment.
[[nodiscard]] std::int64_t estimate_segment_count(double total_duration_secs,
                                                  const SegmentTemplate& tmpl) noexcept;

// Substitute every $Number$ placeholder with the decimal index
[[nodiscard]] std::string expand_media_path(std::string_view pattern, std::int64_t index);

// Substitute every $RepresentationID$ placeholder with the representation id
[[nodiscard]] std::string expand_representation_id(std::string_view pattern, std::string_view id);

} // namespace dashgrab::core
