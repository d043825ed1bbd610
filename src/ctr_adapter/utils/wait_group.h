// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stdexcept>

namespace ctr_adapter::utils {

class wait_group
{
public:
    wait_group() = default;
    wait_group(const wait_group &) = delete;
    auto operator=(const wait_group &) -> wait_group & = delete;
    wait_group(wait_group &&) = delete;
    auto operator=(wait_group &&) -> wait_group & = delete;
    ~wait_group() = default;

    void add(std::size_t n = 1)
    {
        std::lock_guard lock(mutex_);
        pending_ += n;
    }

    void done()
    {
        std::lock_guard lock(mutex_);
        if (pending_ == 0) {
            throw std::logic_error("wait_group::done called more times than add");
        }

        if (--pending_ == 0) {
            zero_.notify_all();
        }
    }

    void wait()
    {
        std::unique_lock lock(mutex_);
        zero_.wait(lock, [this] { return pending_ == 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable zero_;
    std::size_t pending_{ 0 };
};

} // namespace ctr_adapter::utils
