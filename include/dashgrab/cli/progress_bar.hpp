// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace dashgrab::cli {

// Segment progress bar for one stream
class ProgressBar {
public:
    explicit ProgressBar(std::int64_t total = 0, std::string_view label = {});

    // Update progress
    void update(std::int64_t segments, std::uint64_t bytes) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::int64_t total() const noexcept { return total_; }
    void total(std::int64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

    // Switch to another stream, starting over from zero
    void reset(std::string_view label, std::int64_t total) noexcept;

    [[nodiscard]] std::string render(std::int64_t segments, std::uint64_t bytes,
                                     std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);

private:
    std::int64_t total_{0};
    std::int64_t last_segments_{-1};
    std::uint64_t last_bytes_{0};
    std::string label_;
    bool finished_{false};
    std::chrono::steady_clock::time_point start_{std::chrono::steady_clock::now()};
};

} // namespace dashgrab::cli
