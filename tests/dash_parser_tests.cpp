// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dashgrab/media/dash_parser.hpp>
#include <dashgrab/core/error.hpp>

using namespace dashgrab::media;
using dashgrab::core::DownloadErrc;

namespace {

constexpr std::string_view SAMPLE_MPD = R"(<?xml version="1.0" encoding="UTF-8"?>
<MPD xmlns="urn:mpeg:dash:schema:mpd:2011" type="static"
     mediaPresentationDuration="PT5M59.7S" minBufferTime="PT8S">
  <ProgramInformation>
    <Title>Test Video Title</Title>
  </ProgramInformation>
  <Period>
    <AdaptationSet id="0" mimeType="video/mp4" contentType="video">
      <SegmentTemplate timescale="90000" duration="360000" startNumber="0"
                       initialization="$RepresentationID$/init.mp4"
                       media="$RepresentationID$/seg_$Number$.mp4"/>
      <Representation id="v360" bandwidth="400000" codecs="avc1.4d401e" width="640" height="360"/>
      <Representation id="v720" bandwidth="1500000" codecs="avc1.4d401f" width="1280" height="720"/>
      <Representation id="v1080" bandwidth="4000000" codecs="avc1.640028" width="1920" height="1080">
        <SegmentTemplate media="hi/$Number$.m4s"/>
      </Representation>
    </AdaptationSet>
    <AdaptationSet id="1" mimeType="audio/mp4" contentType="audio">
      <Representation id="a0" bandwidth="128000" codecs="mp4a.40.2">
        <SegmentTemplate timescale="48000" duration="192000"
                         initialization="audio/init.mp4" media="audio/seg_$Number$.mp4"/>
      </Representation>
      <Representation id="a1" bandwidth="64000" codecs="mp4a.40.2"/>
    </AdaptationSet>
  </Period>
</MPD>)";

DASHRepresentation make_rep(std::string id, std::string mime, std::uint32_t height) {
    DASHRepresentation rep;
    rep.id = std::move(id);
    rep.mime_type = std::move(mime);
    rep.height = height;
    return rep;
}

DASHManifest ladder_manifest() {
    DASHManifest manifest;
    DASHAdaptationSet video;
    video.mime_type = "video/mp4";
    video.representations = {
        make_rep("240p", "video/mp4", 240),
        make_rep("360p", "video/mp4", 360),
        make_rep("720p", "video/mp4", 720),
        make_rep("1080p", "video/mp4", 1080),
    };
    DASHAdaptationSet audio;
    audio.mime_type = "audio/mp4";
    audio.representations = {
        make_rep("audio1", "audio/mp4", 0),
        make_rep("audio2", "audio/mp4", 0),
    };
    manifest.adaptation_sets = {video, audio};
    return manifest;
}

} // namespace

TEST_CASE("DASHParser - presentation attributes", "[dash]") {
    auto manifest = DASHParser::parse(SAMPLE_MPD);
    REQUIRE(manifest.has_value());

    CHECK(manifest->media_presentation_duration == "PT5M59.7S");
    CHECK(manifest->duration_seconds == Catch::Approx(359.7));
    CHECK(manifest->min_buffer_time == Catch::Approx(8.0));
    CHECK(manifest->title == "Test Video Title");
    CHECK(!manifest->is_live);
    REQUIRE(manifest->adaptation_sets.size() == 2);
    CHECK(manifest->adaptation_sets[0].content_type == "video");
    CHECK(manifest->adaptation_sets[1].representations.size() == 2);
}

TEST_CASE("DASHParser - segment template inheritance", "[dash]") {
    auto manifest = DASHParser::parse(SAMPLE_MPD);
    REQUIRE(manifest.has_value());
    const auto& video = manifest->adaptation_sets[0].representations;
    REQUIRE(video.size() == 3);

    SECTION("Adaptation set template with representation id") {
        const auto& tmpl = video[1].segment_template;
        CHECK(video[1].mime_type == "video/mp4");
        CHECK(video[1].codecs == "avc1.4d401f");
        CHECK(tmpl.initialization == "v720/init.mp4");
        CHECK(tmpl.media == "v720/seg_$Number$.mp4");
        CHECK(tmpl.start_number == 0);
        CHECK(tmpl.timescale == 90000);
        CHECK(tmpl.duration == 360000);
    }

    SECTION("Representation overrides single attributes") {
        const auto& tmpl = video[2].segment_template;
        CHECK(tmpl.media == "hi/$Number$.m4s");
        CHECK(tmpl.initialization == "v1080/init.mp4");
        CHECK(tmpl.duration == 360000);
    }

    SECTION("Representation-only template gets DASH defaults") {
        const auto& audio = manifest->adaptation_sets[1].representations;
        const auto& tmpl = audio[0].segment_template;
        CHECK(tmpl.initialization == "audio/init.mp4");
        CHECK(tmpl.start_number == 1);
        CHECK(tmpl.timescale == 48000);
        CHECK(tmpl.duration_seconds() == Catch::Approx(4.0));
    }

    SECTION("Descriptor carries the template") {
        auto descriptor = video[0].descriptor();
        CHECK(descriptor.id == "v360");
        CHECK(descriptor.bandwidth == 400000);
        CHECK(descriptor.segment_template.media == "v360/seg_$Number$.mp4");
    }
}

TEST_CASE("DASHParser - invalid documents", "[dash]") {
    SECTION("Malformed XML") {
        auto manifest = DASHParser::parse("<MPD><Period>");
        REQUIRE(!manifest.has_value());
        CHECK(manifest.error() == DownloadErrc::manifest_invalid);
    }

    SECTION("Not an MPD") {
        auto manifest = DASHParser::parse("<html><body/></html>");
        REQUIRE(!manifest.has_value());
        CHECK(manifest.error() == DownloadErrc::manifest_invalid);
    }

    SECTION("Empty input") {
        CHECK(!DASHParser::parse("").has_value());
    }
}

TEST_CASE("DASHParser - live presentations are flagged", "[dash]") {
    auto manifest = DASHParser::parse(R"(<MPD type="dynamic"><Period/></MPD>)");
    REQUIRE(manifest.has_value());
    CHECK(manifest->is_live);
    CHECK(manifest->adaptation_sets.empty());
    CHECK(manifest->duration_seconds == 0.0);
}

TEST_CASE("DASHManifest - video selection by closest height", "[dash]") {
    auto manifest = ladder_manifest();

    struct Case {
        std::uint32_t target;
        const char* expected;
    };
    const Case cases[] = {
        {1080, "1080p"},
        {360, "360p"},
        {100, "240p"},
        {2000, "1080p"},
        {500, "360p"},   // |500-360| = 140, |500-720| = 220
        {600, "720p"},   // |600-360| = 240, |600-720| = 120
    };

    for (const auto& c : cases) {
        CAPTURE(c.target);
        auto rep = manifest.select_video(c.target);
        REQUIRE(rep.has_value());
        CHECK(rep->id == c.expected);
    }
}

TEST_CASE("DASHManifest - ties keep the first representation", "[dash]") {
    auto manifest = ladder_manifest();
    // 540 is 180 away from both 360 and 720
    auto rep = manifest.select_video(540);
    REQUIRE(rep.has_value());
    CHECK(rep->id == "360p");
}

TEST_CASE("DASHManifest - audio selection", "[dash]") {
    auto manifest = ladder_manifest();
    auto rep = manifest.select_audio();
    REQUIRE(rep.has_value());
    CHECK(rep->id == "audio1");
}

TEST_CASE("DASHManifest - missing streams", "[dash]") {
    DASHManifest empty;
    CHECK(empty.select_video(1080).error() == DownloadErrc::no_video_stream);
    CHECK(empty.select_audio().error() == DownloadErrc::no_audio_stream);

    DASHManifest webm;
    DASHAdaptationSet set;
    set.representations = {make_rep("vp9", "video/webm", 1080)};
    webm.adaptation_sets = {set};
    CHECK(!webm.select_video(1080).has_value());
}

TEST_CASE("DASHParser::is_dash_url", "[dash]") {
    CHECK(DASHParser::is_dash_url("https://example.com/video/manifest/video.mpd"));
    CHECK(DASHParser::is_dash_url("https://example.com/VIDEO.MPD"));
    CHECK(DASHParser::is_dash_url("https://example.com/video.mpd?token=abc"));
    CHECK(!DASHParser::is_dash_url("https://example.com/video/iframe"));
    CHECK(!DASHParser::is_dash_url("https://example.com/video.mpd.mp4"));
}

TEST_CASE("ISO 8601 durations", "[dash]") {
    CHECK(parse_iso8601_duration("PT1M30S") == Catch::Approx(90.0));
    CHECK(parse_iso8601_duration("PT45S") == Catch::Approx(45.0));
    CHECK(parse_iso8601_duration("PT5M59.7S") == Catch::Approx(359.7));
    CHECK(parse_iso8601_duration("PT1H") == Catch::Approx(3600.0));
    CHECK(parse_iso8601_duration("P1DT1S") == Catch::Approx(86401.0));
    CHECK(parse_iso8601_duration("") == 0.0);
    CHECK(parse_iso8601_duration("garbage") == 0.0);
    CHECK(parse_iso8601_duration("PT5X") == 0.0);
    CHECK(parse_iso8601_duration("PTinfS") == 0.0);
    CHECK(parse_iso8601_duration("PTnanS") == 0.0);
    CHECK(parse_iso8601_duration("PT1e308H") == 0.0);
    CHECK(parse_iso8601_duration("PT1e300S") == Catch::Approx(1e300));
}
