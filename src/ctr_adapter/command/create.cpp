// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/create.h"

#include "ctr_adapter/command/common.h"
#include "ctr_adapter/utils/platform.h"

#include <iostream>

auto ctr_adapter::command::create(const global_options &global, const create_options &options)
        -> int
{
    auto config = options.config;
    config.stop_signal = utils::parse_signal(options.stop_signal);

    auto runtime = open_runtime(global);
    auto container = runtime->create(config);

    std::cout << container->id() << std::endl;
    return 0;
}
