// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/core/segment.hpp>
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <cstdint>
#include <system_error>

namespace dashgrab::media {

// DASH (Dynamic Adaptive Streaming over HTTP) representation
struct DASHRepresentation {
    std::string id;
    std::uint64_t bandwidth{0};      // Bitrate in bps
    std::string mime_type;           // "video/mp4" or "audio/mp4"
    std::string codecs;
    std::uint32_t width{0};
    std::uint32_t height{0};
    core::SegmentTemplate segment_template;

    [[nodiscard]] core::StreamDescriptor descriptor() const;
};

// DASH adaptation set (group of representations)
struct DASHAdaptationSet {
    std::string id;
    std::string mime_type;
    std::string content_type;       // "video" or "audio"
    std::vector<DASHRepresentation> representations;
};

// DASH manifest (MPD)
struct DASHManifest {
    std::vector<DASHAdaptationSet> adaptation_sets;
    std::string media_presentation_duration;   // Raw ISO 8601 value
    double duration_seconds{0.0};
    double min_buffer_time{0.0};
    std::string title;                         // ProgramInformation/Title
    bool is_live{false};

    // Video representation whose height is closest to the target
    [[nodiscard]] std::expected<DASHRepresentation, std::error_code>
    select_video(std::uint32_t target_height) const;

    // First representation of the first audio adaptation set
    [[nodiscard]] std::expected<DASHRepresentation, std::error_code>
    select_audio() const;
};

// DASH MPD parser
class DASHParser {
public:
    // Parse MPD manifest content
    [[nodiscard]] static std::expected<DASHManifest, std::error_code>
    parse(std::string_view content) noexcept;

    // Check if URL is a DASH manifest
    [[nodiscard]] static bool is_dash_url(std::string_view url) noexcept;
};

// Parse an ISO 8601 duration such as "PT5M59.7S" into seconds.
// Returns 0 for values that cannot be parsed.
[[nodiscard]] double parse_iso8601_duration(std::string_view value) noexcept;

} // namespace dashgrab::media
