// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/process.h"

#include <csignal>
#include <system_error>

#include <sys/wait.h>

namespace ctr_adapter::utils {

auto waitpid(pid_t pid, int options) -> WaitResult
{
    int status{ 0 };
    while (true) {
        auto ret = ::waitpid(pid, &status, options);
        if (ret > 0) {
            return { WaitStatus::Reaped, ret, status };
        }

        if (ret == 0) { // fow WNOHANG
            return { WaitStatus::None };
        }

        if (errno == EINTR || errno == EAGAIN) {
            continue;
        }

        if (errno == ECHILD) {
            return { WaitStatus::NoChild };
        }

        throw std::system_error(errno, std::system_category(), "waitpid");
    }
}

auto decode_wait_status(int status) noexcept -> int
{
    return WIFSIGNALED(status) ? 128 + WTERMSIG(status) : WEXITSTATUS(status);
}

auto process_alive(pid_t pid) noexcept -> bool
{
    if (pid <= 0) {
        return false;
    }

    return ::kill(pid, 0) == 0 || errno == EPERM;
}

} // namespace ctr_adapter::utils
