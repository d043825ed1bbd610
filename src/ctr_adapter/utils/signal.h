// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/utils/file_describer.h"

#include <csignal> // IWYU pragma: keep

namespace ctr_adapter::utils {

auto sigemptyset(sigset_t &set) -> void;

auto sigaddset(sigset_t &set, int signo) -> void;

auto sigprocmask(int how, const sigset_t &new_set, sigset_t *old_set) -> void;

auto create_signalfd(sigset_t &set, bool nonblock = true) -> file_descriptor;

} // namespace ctr_adapter::utils
