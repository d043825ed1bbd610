// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/common.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/impl/local_runtime.h"
#include "ctr_adapter/run_orchestrator.h"

auto ctr_adapter::command::load_runtime_config(const global_options &global) -> runtime_config
{
    config_overrides overrides;
    overrides.root = global.root;
    overrides.tmp_dir = global.tmp_dir;
    overrides.oci_runtime = global.runtime;

    return load_config(global.config, overrides);
}

auto ctr_adapter::command::open_runtime(const global_options &global)
        -> std::unique_ptr<runtime_store>
{
    return std::make_unique<impl::local_runtime>(load_runtime_config(global));
}

auto ctr_adapter::command::report(const batch_result &result, std::ostream &out, std::ostream &err)
        -> int
{
    for (const auto &id : result.ok) {
        out << id << '\n';
    }
    out.flush();

    for (const auto &[id, failure] : result.failures) {
        err << "Error: " << id << ": " << describe(failure) << '\n';
    }

    return result.failures.empty() ? 0 : default_run_exit_code;
}
