// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <dashgrab/core/url.hpp>
#include <dashgrab/core/error.hpp>
#include <atomic>
#include <string_view>
#include <thread>
#include <vector>

using namespace dashgrab::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/video/manifest/video.mpd");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "example.com");
        CHECK(url.path() == "/video/manifest/video.mpd");
        CHECK(url.is_secure());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://127.0.0.1:8080/init.mp4");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
        CHECK(result->host() == "127.0.0.1");
        CHECK(result->port() == "8080");
        CHECK(!result->is_secure());
        CHECK(result->base() == "http://127.0.0.1:8080");
    }

    SECTION("Scheme is case-insensitive") {
        auto result = Url::parse("HTTPS://example.com/a");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/seg.mp4?token=abc#frag");
        REQUIRE(result.has_value());
        CHECK(result->query() == "token=abc");
        CHECK(result->fragment() == "frag");
        CHECK(result->full() == "https://example.com/seg.mp4?token=abc#frag");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    SECTION("Missing scheme") {
        CHECK(!Url::parse("example.com/file.mp4").has_value());
    }

    SECTION("Empty string") {
        CHECK(!Url::parse("").has_value());
    }

    SECTION("Control character in host") {
        auto result = Url::parse("http://ba\nse.com");
        REQUIRE(!result.has_value());
        CHECK(result.error() == DownloadErrc::invalid_url);
    }

    SECTION("Non-numeric port") {
        CHECK(!Url::parse("http://example.com:80a/").has_value());
    }
}

TEST_CASE("resolve_url - segment references", "[url]") {
    struct Case {
        const char* base;
        const char* reference;
        const char* expected;
    };

    const Case cases[] = {
        {"https://example.com/video/manifest.mpd", "segment.mp4",
         "https://example.com/video/segment.mp4"},
        {"https://example.com/video/manifest/video.mpd", "../../segment.mp4",
         "https://example.com/segment.mp4"},
        // A reference with a path replaces the base query
        {"https://example.com/manifest.mpd?token=123", "segment.mp4?query=abc",
         "https://example.com/segment.mp4?query=abc"},
        {"https://example.com/manifest.mpd?token=123", "segment.mp4",
         "https://example.com/segment.mp4"},
        {"http://127.0.0.1:8080", "/init.mp4", "http://127.0.0.1:8080/init.mp4"},
        {"http://127.0.0.1:8080", "init.mp4", "http://127.0.0.1:8080/init.mp4"},
        {"https://example.com/a/b/c.mpd", "/root.mp4", "https://example.com/root.mp4"},
        {"https://example.com/a/b/c.mpd", "//cdn.example.net/x.mp4", "https://cdn.example.net/x.mp4"},
        {"https://example.com/a/b/c.mpd", "http://other.example/seg.mp4", "http://other.example/seg.mp4"},
        {"https://example.com/a/b/c.mpd", "./seg.mp4", "https://example.com/a/b/seg.mp4"},
    };

    for (const auto& c : cases) {
        CAPTURE(c.base, c.reference);
        auto resolved = resolve_url(c.base, c.reference);
        REQUIRE(resolved.has_value());
        CHECK(*resolved == c.expected);
    }
}

TEST_CASE("resolve_url - query-only reference keeps the base path", "[url]") {
    auto resolved = resolve_url("https://example.com/v/manifest.mpd?old=1", "?new=2");
    REQUIRE(resolved.has_value());
    CHECK(*resolved == "https://example.com/v/manifest.mpd?new=2");
}

TEST_CASE("resolve_url - failures", "[url]") {
    SECTION("Control character in reference") {
        auto resolved = resolve_url("http://base.com", "seg\nment.mp4");
        REQUIRE(!resolved.has_value());
        CHECK(resolved.error() == DownloadErrc::invalid_url);
    }

    SECTION("Control character in base") {
        CHECK(!resolve_url("http://ba\nse.com", "segment.mp4").has_value());
    }

    SECTION("Relative base") {
        CHECK(!resolve_url("video/manifest.mpd", "segment.mp4").has_value());
    }
}

TEST_CASE("resolve_url - repeatable and thread independent", "[url]") {
    constexpr std::string_view base = "https://example.com/video/manifest/video.mpd?token=1";
    constexpr std::string_view reference = "../segments/media_42.m4s";

    auto first = resolve_url(base, reference);
    REQUIRE(first.has_value());
    CHECK(*first == "https://example.com/video/segments/media_42.m4s");

    SECTION("Repeated calls") {
        for (int i = 0; i < 100; ++i) {
            auto again = resolve_url(base, reference);
            REQUIRE(again.has_value());
            CHECK(*again == *first);
        }
    }

    SECTION("Concurrent calls") {
        constexpr int threads = 8;
        constexpr int calls = 500;
        std::atomic<int> mismatches{0};
        {
            std::vector<std::jthread> pool;
            for (int t = 0; t < threads; ++t) {
                pool.emplace_back([&] {
                    for (int i = 0; i < calls; ++i) {
                        auto resolved = resolve_url(base, reference);
                        if (!resolved || *resolved != *first) {
                            ++mismatches;
                        }
                    }
                });
            }
        }
        CHECK(mismatches.load() == 0);
    }

    SECTION("Absolute reference ignores the base path") {
        auto a = resolve_url("https://example.com/a/b/c.mpd", "https://cdn.example.net/seg/1.m4s");
        auto b = resolve_url("https://example.com/x/y.mpd?q=1", "https://cdn.example.net/seg/1.m4s");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        CHECK(*a == *b);
        CHECK(*a == "https://cdn.example.net/seg/1.m4s");

        auto rooted_a = resolve_url("https://example.com/a/b/c.mpd", "/seg/1.m4s");
        auto rooted_b = resolve_url("https://example.com/x/y.mpd", "/seg/1.m4s");
        REQUIRE(rooted_a.has_value());
        REQUIRE(rooted_b.has_value());
        CHECK(*rooted_a == *rooted_b);
    }
}

TEST_CASE("remove_dot_segments", "[url]") {
    CHECK(remove_dot_segments("/a/b/c/./../../g") == "/a/g");
    CHECK(remove_dot_segments("mid/content=5/../6") == "mid/6");
    CHECK(remove_dot_segments("/../a") == "/a");
    CHECK(remove_dot_segments("/a/b/..") == "/a/");
    CHECK(remove_dot_segments("") == "");
}
