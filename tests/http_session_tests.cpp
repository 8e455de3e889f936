// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include "http_test_server.hpp"
#include "test_paths.hpp"
#include <dashgrab/core/http_session.hpp>
#include <dashgrab/core/stream_downloader.hpp>
#include <dashgrab/core/error.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace dashgrab::core;
using dashgrab::test::HttpTestServer;
using namespace std::chrono_literals;

namespace {

std::string to_string(const Payload& payload) {
    std::string text;
    text.reserve(payload.size());
    for (auto b : payload) text += static_cast<char>(b);
    return text;
}

// A loopback port with nothing listening on it
std::uint16_t unused_port() {
    std::uint16_t port = 0;
    {
        HttpTestServer probe;
        port = probe.port();
    }
    return port;
}

} // namespace

TEST_CASE("HttpSession - successful GET", "[http]") {
    HttpTestServer server;
    server.route("/init.mp4", {200, "init data"});

    HttpSession session;
    auto response = session.get(server.url() + "/init.mp4");
    REQUIRE(response.has_value());
    CHECK(response->status_code == 200);
    CHECK(to_string(response->body) == "init data");
    CHECK(response->content_type == "application/octet-stream");

    auto payload = session.fetch({}, server.url() + "/init.mp4");
    REQUIRE(payload.has_value());
    CHECK(to_string(*payload) == "init data");
}

TEST_CASE("HttpSession - non-2xx status is an error", "[http]") {
    HttpTestServer server;
    server.route("/broken.mp4", {500, "oops"});

    HttpSession session;

    SECTION("Server error") {
        auto response = session.get(server.url() + "/broken.mp4");
        REQUIRE(!response.has_value());
        CHECK(response.error().code == DownloadErrc::http_status);
        CHECK(response.error().status_code == 500);
        CHECK(response.error().is_status());
        CHECK(response.error().message() == "HTTP status 500");
    }

    SECTION("Not found") {
        auto response = session.get(server.url() + "/missing.mp4");
        REQUIRE(!response.has_value());
        CHECK(response.error().status_code == 404);
    }
}

TEST_CASE("HttpSession - transport failures", "[http]") {
    HttpSession session(HttpOptions{5, 5});

    SECTION("Connection refused") {
        auto response = session.get("http://127.0.0.1:" + std::to_string(unused_port()) + "/x");
        REQUIRE(!response.has_value());
        CHECK(response.error().code == DownloadErrc::refused);
        CHECK(!response.error().is_status());
    }

    SECTION("Malformed URL") {
        auto response = session.get("not a url");
        REQUIRE(!response.has_value());
        CHECK(!response.error().is_status());
    }
}

TEST_CASE("HttpSession - cancellation", "[http]") {
    HttpTestServer server;
    server.route("/hang.mp4", {200, "", true});
    HttpSession session;

    SECTION("Already cancelled") {
        std::stop_source stop;
        stop.request_stop();
        auto response = session.get(server.url() + "/hang.mp4", stop.get_token());
        REQUIRE(!response.has_value());
        CHECK(response.error().code == DownloadErrc::cancelled);
        CHECK(server.requests() == 0);
    }

    SECTION("Cancelled while waiting for the response") {
        std::stop_source stop;
        std::jthread canceller([&stop] {
            std::this_thread::sleep_for(100ms);
            stop.request_stop();
        });

        auto started = std::chrono::steady_clock::now();
        auto response = session.get(server.url() + "/hang.mp4", stop.get_token());
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(!response.has_value());
        CHECK(response.error().code == DownloadErrc::cancelled);
        CHECK(elapsed < 5s);
    }
}

TEST_CASE("StreamDownloader over HTTP", "[http][downloader]") {
    HttpTestServer server;
    server.route("/init.mp4", {200, "init data"});
    server.route("/media_0.mp4", {200, "media 0"});
    server.route("/media_1.mp4", {200, "media 1"});

    StreamDescriptor stream;
    stream.id = "test_rep";
    stream.segment_template.initialization = "/init.mp4";
    stream.segment_template.media = "/media_$Number$.mp4";
    stream.segment_template.start_number = 0;
    stream.segment_template.timescale = 1;
    stream.segment_template.duration = 2;

    auto dir = dashgrab::test::scratch_dir("http");

    HttpSession session;
    DownloaderOptions options;
    options.temp_dir = dir;
    StreamDownloader downloader(session, options);

    SECTION("Segments land in order") {
        auto path = downloader.download(stream, server.url(), 3.0);
        REQUIRE(path.has_value());

        std::ifstream in(*path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        CHECK(ss.str() == "init datamedia 0media 1");
    }

    SECTION("Segment failure removes the partial file") {
        // 11s at 5s per segment needs media_2, which is not served
        stream.segment_template.duration = 5;
        auto path = downloader.download(stream, server.url(), 11.0);
        REQUIRE(!path.has_value());
        CHECK(path.error().stage == FailureStage::media_segment);
        CHECK(path.error().http_status == 404);
        CHECK(std::filesystem::is_empty(dir));
    }

    SECTION("Init failure") {
        stream.segment_template.initialization = "/no-init.mp4";
        auto path = downloader.download(stream, server.url(), 3.0);
        REQUIRE(!path.has_value());
        CHECK(path.error().stage == FailureStage::init_segment);
        CHECK(std::filesystem::is_empty(dir));
    }

    std::filesystem::remove_all(dir);
}
