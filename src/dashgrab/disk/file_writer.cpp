// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace dashgrab::disk {

std::error_code from_errno(int err) noexcept {
    switch (err) {
        case ENOSPC:
        case EDQUOT:
            return make_error_code(DiskErrc::disk_full);
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOENT:
            return make_error_code(DiskErrc::file_not_found);
        case EEXIST:
            return make_error_code(DiskErrc::file_exists);
        case ENAMETOOLONG:
        case ENOTDIR:
            return make_error_code(DiskErrc::invalid_path);
        case EBADF:
            return make_error_code(DiskErrc::handle_invalid);
        default:
            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

std::expected<FileWriter, std::error_code>
FileWriter::create_temp(const std::filesystem::path& dir,
                        std::string_view prefix,
                        std::string_view suffix) noexcept {
    std::string pattern = (dir / std::string(prefix)).string();
    pattern += "XXXXXX";
    pattern += suffix;

    // mkstemps rewrites the X's in place
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    int fd = ::mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return std::unexpected(from_errno(errno));
    }

    return FileWriter(fd, std::filesystem::path(buffer.data()));
}

std::expected<FileWriter, std::error_code>
FileWriter::open(const std::filesystem::path& path) noexcept {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(from_errno(errno));
    }
    return FileWriter(fd, path);
}

FileWriter::~FileWriter() {
    if (!committed_) {
        discard();
    } else {
        close();
    }
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
    , bytes_written_(other.bytes_written_)
    , committed_(std::exchange(other.committed_, true)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        if (!committed_) {
            discard();
        } else {
            close();
        }
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
        bytes_written_ = other.bytes_written_;
        committed_ = std::exchange(other.committed_, true);
    }
    return *this;
}

std::error_code FileWriter::append(std::span<const std::byte> data) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd_, ptr, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno);
        }
        ptr += n;
        remaining -= static_cast<std::size_t>(n);
        bytes_written_ += static_cast<std::uint64_t>(n);
    }
    return {};
}

std::error_code FileWriter::commit() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    std::error_code ec;
    if (::fsync(fd_) != 0 && errno != EINVAL) {
        ec = errno == ENOSPC || errno == EDQUOT ? from_errno(errno) : make_error_code(DiskErrc::sync_error);
    }
    if (::close(fd_) != 0 && !ec) {
        ec = errno == ENOSPC || errno == EDQUOT ? from_errno(errno) : make_error_code(DiskErrc::sync_error);
    }
    fd_ = -1;

    if (ec) {
        discard();
        return ec;
    }
    committed_ = true;
    return {};
}

void FileWriter::discard() noexcept {
    close();
    if (!path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove {}: {}", path_.string(), ec.message());
        }
        path_.clear();
    }
    committed_ = false;
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace dashgrab::disk
