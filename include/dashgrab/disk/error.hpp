// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace dashgrab::disk {

// Failures of the stream output file. Zero is not used: a default
// std::error_code means success.
enum class DiskErrc {
    disk_full = 1,
    access_denied,
    file_not_found,
    invalid_path,
    file_exists,
    write_error,
    sync_error,       // fsync/close failed while committing
    handle_invalid,   // Writer already committed, discarded or moved from
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "dashgrab::disk";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::disk_full:       return "No space left for stream data";
            case DiskErrc::access_denied:   return "Output location is not writable";
            case DiskErrc::file_not_found:  return "Output directory does not exist";
            case DiskErrc::invalid_path:    return "Invalid output path";
            case DiskErrc::file_exists:     return "Output file already exists";
            case DiskErrc::write_error:     return "Failed to write stream data";
            case DiskErrc::sync_error:      return "Failed to flush stream file";
            case DiskErrc::handle_invalid:  return "Stream file is not open";
        }
        return "Unknown disk error";
    }

    // Lets callers compare against portable std::errc values
    [[nodiscard]] std::error_condition default_error_condition(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::disk_full:       return std::errc::no_space_on_device;
            case DiskErrc::access_denied:   return std::errc::permission_denied;
            case DiskErrc::file_not_found:  return std::errc::no_such_file_or_directory;
            case DiskErrc::invalid_path:    return std::errc::invalid_argument;
            case DiskErrc::file_exists:     return std::errc::file_exists;
            case DiskErrc::write_error:
            case DiskErrc::sync_error:      return std::errc::io_error;
            case DiskErrc::handle_invalid:  return std::errc::bad_file_descriptor;
        }
        return {ev, *this};
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

// Map an errno value from a failed syscall onto DiskErrc
[[nodiscard]] std::error_code from_errno(int err) noexcept;

} // namespace dashgrab::disk

namespace std {

template<>
struct is_error_code_enum<dashgrab::disk::DiskErrc> : true_type {};

} // namespace std
