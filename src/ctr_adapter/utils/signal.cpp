// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/signal.h"

#include <sys/signalfd.h>

#include <system_error>

namespace ctr_adapter::utils {

auto sigemptyset(sigset_t &set) -> void
{
    auto ret = ::sigemptyset(&set);
    if (ret < 0) {
        throw std::system_error(errno, std::system_category(), "sigemptyset");
    }
}

auto sigaddset(sigset_t &set, int signo) -> void
{
    auto ret = ::sigaddset(&set, signo);
    if (ret < 0) {
        const std::string msg{ "failed to add signal " + std::to_string(signo) };
        throw std::system_error(errno, std::system_category(), msg);
    }
}

auto sigprocmask(int how, const sigset_t &new_set, sigset_t *old_set) -> void
{
    auto ret = ::sigprocmask(how, &new_set, old_set);
    if (ret < 0) {
        throw std::system_error(errno, std::system_category(), "sigprocmask");
    }
}

auto create_signalfd(sigset_t &set, bool nonblock) -> file_descriptor
{
    unsigned flags = SFD_CLOEXEC;
    if (nonblock) {
        flags |= SFD_NONBLOCK;
    }

    auto ret = ::signalfd(-1, &set, static_cast<int>(flags));
    if (ret < 0) {
        throw std::system_error(errno, std::system_category(), "signalfd");
    }

    return file_descriptor(ret);
}

} // namespace ctr_adapter::utils
