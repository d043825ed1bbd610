// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/stop.h"

#include "ctr_adapter/command/common.h"

auto ctr_adapter::command::stop(const global_options &global, const stop_options &options) -> int
{
    auto runtime = open_runtime(global);
    return report(stop_containers(*runtime, stop_request{ options.select, options.timeout }));
}
