// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/kill.h"

#include "ctr_adapter/command/common.h"
#include "ctr_adapter/utils/platform.h"

auto ctr_adapter::command::kill(const global_options &global, const kill_options &options) -> int
{
    // a bad signal fails before any container is looked at
    auto sig = utils::parse_signal(options.signal);

    auto runtime = open_runtime(global);
    return report(kill_containers(*runtime, options.select, sig));
}
