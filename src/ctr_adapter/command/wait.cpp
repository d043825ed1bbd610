// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/wait.h"

#include "ctr_adapter/command/common.h"

auto ctr_adapter::command::wait(const global_options &global, const wait_options &options) -> int
{
    auto runtime = open_runtime(global);

    auto interval = runtime->config().wait_interval;
    if (options.interval) {
        interval = std::chrono::milliseconds{ *options.interval };
    }

    return report(wait_containers(*runtime, options.select, interval));
}
