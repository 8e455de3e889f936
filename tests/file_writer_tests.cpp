// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include "test_paths.hpp"
#include <dashgrab/disk/file_writer.hpp>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace dashgrab::disk;

namespace {

std::filesystem::path scratch_dir() {
    return dashgrab::test::scratch_dir("file-writer");
}

std::span<const std::byte> bytes_of(std::string_view text) {
    return std::as_bytes(std::span<const char>(text.data(), text.size()));
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("FileWriter - temp file naming", "[disk]") {
    auto dir = scratch_dir();

    auto writer = FileWriter::create_temp(dir, "stream-v1-", ".mp4");
    REQUIRE(writer.has_value());
    CHECK(writer->is_open());
    CHECK(writer->path().parent_path() == dir);

    auto name = writer->path().filename().string();
    CHECK(name.starts_with("stream-v1-"));
    CHECK(name.ends_with(".mp4"));
    CHECK(name.size() == std::string_view("stream-v1-XXXXXX.mp4").size());
    CHECK(std::filesystem::exists(writer->path()));

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriter - commit keeps the file", "[disk]") {
    auto dir = scratch_dir();
    std::filesystem::path path;
    {
        auto writer = FileWriter::create_temp(dir, "keep-", ".bin");
        REQUIRE(writer.has_value());
        REQUIRE(!writer->append(bytes_of("init ")));
        REQUIRE(!writer->append(bytes_of("media")));
        CHECK(writer->bytes_written() == 10);
        REQUIRE(!writer->commit());
        CHECK(writer->committed());
        CHECK(!writer->is_open());
        path = writer->path();
    }

    CHECK(read_file(path) == "init media");
    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriter - uncommitted file is removed", "[disk]") {
    auto dir = scratch_dir();
    std::filesystem::path path;
    {
        auto writer = FileWriter::create_temp(dir, "drop-", ".bin");
        REQUIRE(writer.has_value());
        REQUIRE(!writer->append(bytes_of("partial")));
        path = writer->path();
        CHECK(std::filesystem::exists(path));
    }

    CHECK(!std::filesystem::exists(path));
    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriter - explicit discard", "[disk]") {
    auto dir = scratch_dir();

    auto writer = FileWriter::create_temp(dir, "discard-", ".bin");
    REQUIRE(writer.has_value());
    auto path = writer->path();
    writer->discard();

    CHECK(!writer->is_open());
    CHECK(!std::filesystem::exists(path));
    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriter - moved writer owns the file", "[disk]") {
    auto dir = scratch_dir();
    std::filesystem::path path;
    {
        auto writer = FileWriter::create_temp(dir, "move-", ".bin");
        REQUIRE(writer.has_value());
        path = writer->path();

        FileWriter moved = std::move(*writer);
        REQUIRE(!moved.append(bytes_of("abc")));
        REQUIRE(!moved.commit());
    }

    CHECK(read_file(path) == "abc");
    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriter - open truncates", "[disk]") {
    auto dir = scratch_dir();
    auto path = dir / "out.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out << "old contents";
    }

    auto writer = FileWriter::open(path);
    REQUIRE(writer.has_value());
    REQUIRE(!writer->append(bytes_of("new")));
    REQUIRE(!writer->commit());
    CHECK(read_file(path) == "new");

    std::filesystem::remove_all(dir);
}

TEST_CASE("FileWriter - failures", "[disk]") {
    SECTION("Missing directory") {
        auto writer = FileWriter::create_temp("/nonexistent-dashgrab-dir", "x-", ".bin");
        REQUIRE(!writer.has_value());
        CHECK(writer.error() == DiskErrc::file_not_found);
    }

    SECTION("errno mapping") {
        CHECK(from_errno(ENOSPC) == DiskErrc::disk_full);
        CHECK(from_errno(EACCES) == DiskErrc::access_denied);
        CHECK(from_errno(ENOENT) == DiskErrc::file_not_found);
        CHECK(from_errno(EIO) == DiskErrc::write_error);
    }

    SECTION("Portable conditions") {
        CHECK(make_error_code(DiskErrc::disk_full) == std::errc::no_space_on_device);
        CHECK(from_errno(EACCES) == std::errc::permission_denied);
        CHECK(make_error_code(DiskErrc::sync_error) == std::errc::io_error);
        CHECK(make_error_code(DiskErrc::handle_invalid) != std::errc::io_error);
        CHECK(!make_error_code(DiskErrc::write_error).message().empty());
    }

    SECTION("Writer used after commit") {
        auto dir = scratch_dir();
        auto writer = FileWriter::create_temp(dir, "after-", ".bin");
        REQUIRE(writer.has_value());
        REQUIRE(!writer->commit());
        CHECK(writer->append(bytes_of("late")) == DiskErrc::handle_invalid);
        CHECK(writer->commit() == std::errc::bad_file_descriptor);
        std::filesystem::remove_all(dir);
    }
}
