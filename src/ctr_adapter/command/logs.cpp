// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/logs.h"

#include "ctr_adapter/command/common.h"
#include "ctr_adapter/log_multiplexer.h"

#include <iostream>

auto ctr_adapter::command::logs(const global_options &global, const logs_options &options) -> int
{
    log_options log;
    log.follow = options.follow;
    log.timestamps = options.timestamps;
    log.tail = options.tail;

    auto runtime = open_runtime(global);
    stream_logs(*runtime, options.select, log, std::cout);
    return 0;
}
