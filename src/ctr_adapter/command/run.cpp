// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/run.h"

#include "ctr_adapter/command/common.h"
#include "ctr_adapter/run_orchestrator.h"
#include "ctr_adapter/utils/log.h"
#include "ctr_adapter/utils/platform.h"

auto ctr_adapter::command::run(const global_options &global, const run_options &options) -> int
try {
    auto config = options.config;
    config.stop_signal = utils::parse_signal(options.stop_signal);

    auto runtime = open_runtime(global);
    run_orchestrator orchestrator{ *runtime, std::move(config) };
    return orchestrator.run(default_run_exit_code);
} catch (const std::exception &e) {
    CTR_ADAPTER_ERR() << "Error: " << e.what();
    return default_run_exit_code;
}
