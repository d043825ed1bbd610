// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace ctr_adapter::utils {

// Bounded multi-producer queue. Producers block while it is full, consumers
// block while it is empty and open. Once closed, consumers drain what is left
// and then receive std::nullopt.
template<typename T>
class channel
{
public:
    explicit channel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity)
    {
    }

    channel(const channel &) = delete;
    auto operator=(const channel &) -> channel & = delete;
    channel(channel &&) = delete;
    auto operator=(channel &&) -> channel & = delete;
    ~channel() = default;

    void push(T value)
    {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            throw std::logic_error("push to a closed channel");
        }

        queue_.push_back(std::move(value));
        not_empty_.notify_one();
    }

    [[nodiscard]] auto pop() -> std::optional<T>
    {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }

        auto value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    void close()
    {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] auto closed() const -> bool
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_{ false };
};

} // namespace ctr_adapter::utils
