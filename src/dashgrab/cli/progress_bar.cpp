// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dashgrab/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace dashgrab::cli {

namespace {

constexpr int BAR_WIDTH = 30;

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::int64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::reset(std::string_view label, std::int64_t total) noexcept {
    label_ = label;
    total_ = total;
    last_segments_ = -1;
    last_bytes_ = 0;
    finished_ = false;
    start_ = std::chrono::steady_clock::now();
}

void ProgressBar::update(std::int64_t segments, std::uint64_t bytes) noexcept {
    // Redraw once per written segment
    if (segments == last_segments_ && !finished_) return;
    last_segments_ = segments;
    last_bytes_ = bytes;

    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    std::uint64_t speed = elapsed > 0.0 ? static_cast<std::uint64_t>(static_cast<double>(bytes) / elapsed) : 0;

    try {
        std::cout << '\r' << render(segments, bytes, speed) << std::flush;
    } catch (const std::exception&) {
        // Drop this frame
    }
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    update(std::max<std::int64_t>(last_segments_, 0), last_bytes_);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << '\r' << std::string(80, ' ') << '\r' << std::flush;
}

std::string ProgressBar::render(std::int64_t segments, std::uint64_t bytes,
                                std::uint64_t speed_bps) const {
    double percent = total_ > 0
        ? static_cast<double>(segments) * 100.0 / static_cast<double>(total_)
        : 100.0;
    percent = std::clamp(percent, 0.0, 100.0);

    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));

    std::string line;
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += '[';
    line.append(static_cast<std::size_t>(filled), '=');
    line += '>';
    line.append(static_cast<std::size_t>(BAR_WIDTH - filled), ' ');
    line += ']';

    line += std::format(" {:3}% ({}/{} segments, {})",
                        static_cast<int>(percent), segments, total_, format_bytes(bytes));
    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }
    return line;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    return format_bytes(bps) + "/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    if (bytes >= GB) {
        return std::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    } else if (bytes >= MB) {
        return std::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    } else if (bytes >= KB) {
        return std::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    }
    return std::format("{} B", bytes);
}

} // namespace dashgrab::cli
