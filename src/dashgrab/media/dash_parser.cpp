// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/media/dash_parser.hpp>
#include <dashgrab/core/error.hpp>
#include <pugixml.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace dashgrab::media {

namespace {

constexpr std::string_view VIDEO_MIME = "video/mp4";
constexpr std::string_view AUDIO_MIME = "audio/mp4";

// DASH defaults when the attributes are absent
constexpr std::int64_t DEFAULT_START_NUMBER = 1;
constexpr std::int64_t DEFAULT_TIMESCALE = 1;

// Overlay the attributes present on `node` onto `tmpl`
void apply_template(const pugi::xml_node& node, core::SegmentTemplate& tmpl) {
    if (!node) return;

    if (auto attr = node.attribute("initialization")) {
        tmpl.initialization = attr.as_string();
    }
    if (auto attr = node.attribute("media")) {
        tmpl.media = attr.as_string();
    }
    if (auto attr = node.attribute("startNumber")) {
        tmpl.start_number = attr.as_llong(DEFAULT_START_NUMBER);
    }
    if (auto attr = node.attribute("duration")) {
        tmpl.duration = attr.as_llong(0);
    }
    if (auto attr = node.attribute("timescale")) {
        tmpl.timescale = attr.as_llong(DEFAULT_TIMESCALE);
    }
}

} // namespace

core::StreamDescriptor DASHRepresentation::descriptor() const {
    return core::StreamDescriptor{id, bandwidth, segment_template};
}

//=============================================================================
// DASHManifest
//=============================================================================

std::expected<DASHRepresentation, std::error_code>
DASHManifest::select_video(std::uint32_t target_height) const {
    const DASHRepresentation* best = nullptr;
    std::uint32_t best_diff = 0;

    for (const auto& set : adaptation_sets) {
        for (const auto& rep : set.representations) {
            if (rep.mime_type != VIDEO_MIME) continue;

            std::uint32_t diff = rep.height > target_height
                ? rep.height - target_height
                : target_height - rep.height;
            // Ties keep the first representation seen
            if (!best || diff < best_diff) {
                best = &rep;
                best_diff = diff;
            }
        }
    }

    if (!best) {
        return std::unexpected(make_error_code(core::DownloadErrc::no_video_stream));
    }
    return *best;
}

std::expected<DASHRepresentation, std::error_code>
DASHManifest::select_audio() const {
    for (const auto& set : adaptation_sets) {
        for (const auto& rep : set.representations) {
            if (rep.mime_type == AUDIO_MIME) {
                return rep;
            }
        }
    }
    return std::unexpected(make_error_code(core::DownloadErrc::no_audio_stream));
}

//=============================================================================
// DASHParser
//=============================================================================

bool DASHParser::is_dash_url(std::string_view url) noexcept {
    std::string lower_url;
    lower_url.reserve(url.size());
    for (char c : url) {
        lower_url += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    // Ignore query string and fragment
    auto cut = lower_url.find_first_of("?#");
    if (cut != std::string::npos) {
        lower_url.resize(cut);
    }
    return lower_url.ends_with(".mpd");
}

std::expected<DASHManifest, std::error_code>
DASHParser::parse(std::string_view content) noexcept {
    try {
        pugi::xml_document doc;
        auto loaded = doc.load_buffer(content.data(), content.size());
        if (!loaded) {
            return std::unexpected(make_error_code(core::DownloadErrc::manifest_invalid));
        }

        auto mpd = doc.child("MPD");
        if (!mpd) {
            return std::unexpected(make_error_code(core::DownloadErrc::manifest_invalid));
        }

        DASHManifest manifest;
        manifest.is_live = std::string_view(mpd.attribute("type").as_string()) == "dynamic";
        manifest.media_presentation_duration = mpd.attribute("mediaPresentationDuration").as_string();
        manifest.duration_seconds = parse_iso8601_duration(manifest.media_presentation_duration);
        manifest.min_buffer_time = parse_iso8601_duration(mpd.attribute("minBufferTime").as_string());
        manifest.title = mpd.child("ProgramInformation").child("Title").text().as_string();

        // Only the first period is downloaded
        auto period = mpd.child("Period");
        for (auto set_node : period.children("AdaptationSet")) {
            DASHAdaptationSet set;
            set.id = set_node.attribute("id").as_string();
            set.mime_type = set_node.attribute("mimeType").as_string();
            set.content_type = set_node.attribute("contentType").as_string();

            core::SegmentTemplate set_template;
            set_template.start_number = DEFAULT_START_NUMBER;
            set_template.timescale = DEFAULT_TIMESCALE;
            apply_template(set_node.child("SegmentTemplate"), set_template);

            for (auto rep_node : set_node.children("Representation")) {
                DASHRepresentation rep;
                rep.id = rep_node.attribute("id").as_string();
                rep.bandwidth = rep_node.attribute("bandwidth").as_ullong(0);
                rep.mime_type = rep_node.attribute("mimeType").as_string(set.mime_type.c_str());
                rep.codecs = rep_node.attribute("codecs").as_string();
                rep.width = rep_node.attribute("width").as_uint(0);
                rep.height = rep_node.attribute("height").as_uint(0);

                rep.segment_template = set_template;
                apply_template(rep_node.child("SegmentTemplate"), rep.segment_template);
                rep.segment_template.initialization =
                    core::expand_representation_id(rep.segment_template.initialization, rep.id);
                rep.segment_template.media =
                    core::expand_representation_id(rep.segment_template.media, rep.id);

                set.representations.push_back(std::move(rep));
            }

            manifest.adaptation_sets.push_back(std::move(set));
        }

        return manifest;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(core::DownloadErrc::manifest_invalid));
    }
}

double parse_iso8601_duration(std::string_view value) noexcept {
    if (!value.starts_with('P')) {
        return 0.0;
    }
    value.remove_prefix(1);

    double total = 0.0;
    bool in_time = false;

    while (!value.empty()) {
        if (value.front() == 'T') {
            in_time = true;
            value.remove_prefix(1);
            continue;
        }

        double number = 0.0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
        if (ec != std::errc{} || ptr == value.data() + value.size() || !std::isfinite(number)) {
            return 0.0;
        }

        auto consumed = static_cast<std::size_t>(ptr - value.data());
        char unit = value[consumed];
        value.remove_prefix(consumed + 1);

        if (in_time) {
            switch (unit) {
                case 'H': total += number * 3600.0; break;
                case 'M': total += number * 60.0; break;
                case 'S': total += number; break;
                default:  return 0.0;
            }
        } else {
            switch (unit) {
                case 'W': total += number * 7.0 * 86400.0; break;
                case 'D': total += number * 86400.0; break;
                case 'Y':
                case 'M': break;  // Calendar units have no fixed length
                default:  return 0.0;
            }
        }
    }

    return std::isfinite(total) ? total : 0.0;
}

} // namespace dashgrab::media
