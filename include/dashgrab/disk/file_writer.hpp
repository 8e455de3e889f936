// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <dashgrab/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace dashgrab::disk {

// Append-only byte destination
class Sink {
public:
    virtual ~Sink() = default;

    [[nodiscard]] virtual std::error_code append(std::span<const std::byte> data) noexcept = 0;
};

// Sink backed by a file descriptor. A writer destroyed without commit()
// closes and removes its file, so an aborted download never leaves an
// artifact that looks finished.
class FileWriter final : public Sink {
public:
    // Create a unique file `<prefix>XXXXXX<suffix>` inside `dir`
    [[nodiscard]] static std::expected<FileWriter, std::error_code>
    create_temp(const std::filesystem::path& dir,
                std::string_view prefix,
                std::string_view suffix) noexcept;

    // Create or truncate `path` for writing
    [[nodiscard]] static std::expected<FileWriter, std::error_code>
    open(const std::filesystem::path& path) noexcept;

    ~FileWriter() override;

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    [[nodiscard]] std::error_code append(std::span<const std::byte> data) noexcept override;

    // Flush and close, keeping the file
    [[nodiscard]] std::error_code commit() noexcept;

    // Close and remove the file
    void discard() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] bool committed() const noexcept { return committed_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    FileWriter(int fd, std::filesystem::path path) noexcept
        : fd_(fd), path_(std::move(path)) {}

    void close() noexcept;

    int fd_{-1};
    std::filesystem::path path_;
    std::uint64_t bytes_written_{0};
    bool committed_{false};
};

} // namespace dashgrab::disk
