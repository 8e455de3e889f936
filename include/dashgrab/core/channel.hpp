// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace dashgrab::core {

// Bounded multi-producer/multi-consumer queue that is closed exactly once.
// Blocking calls wake immediately when the supplied stop token fires.
template<typename T>
class Channel {
public:
    explicit Channel(std::size_t capacity) noexcept
        : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Blocks while full. Returns false if the channel is closed or stop
    // was requested before the value could be queued.
    [[nodiscard]] bool push(T value, std::stop_token stoken = {}) {
        std::unique_lock lock(mutex_);
        bool ready = not_full_.wait(lock, stoken, [this] {
            return closed_ || items_.size() < capacity_;
        });
        if (!ready || closed_) {
            return false;
        }

        items_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    // Blocks while empty and open. Returns nullopt once the channel is
    // closed and drained, or when stop is requested.
    [[nodiscard]] std::optional<T> pop(std::stop_token stoken = {}) {
        std::unique_lock lock(mutex_);
        bool ready = not_empty_.wait(lock, stoken, [this] {
            return closed_ || !items_.empty();
        });
        if (!ready || items_.empty()) {
            return std::nullopt;
        }

        T value = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    // No further pushes are accepted; consumers drain what is left
    void close() noexcept {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return;
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] bool closed() const noexcept {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    std::deque<T> items_;
    bool closed_{false};
    mutable std::mutex mutex_;
    std::condition_variable_any not_empty_;
    std::condition_variable_any not_full_;
};

} // namespace dashgrab::core
