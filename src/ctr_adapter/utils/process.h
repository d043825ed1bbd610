// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <cstdint>

#include <sys/types.h>

namespace ctr_adapter::utils {

enum class WaitStatus : uint8_t { Reaped, None, NoChild };

struct WaitResult
{
    WaitStatus status{ WaitStatus::None };
    pid_t pid{ -1 };
    int exit_code{ -1 };
};

auto waitpid(pid_t pid, int options) -> WaitResult;

// Shell convention: 128 + signal number for signaled processes.
auto decode_wait_status(int status) noexcept -> int;

auto process_alive(pid_t pid) noexcept -> bool;

} // namespace ctr_adapter::utils
