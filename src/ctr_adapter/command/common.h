// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/batch.h"
#include "ctr_adapter/command/options.h"
#include "ctr_adapter/config.h"
#include "ctr_adapter/runtime_store.h"

#include <iostream>
#include <memory>

namespace ctr_adapter::command {

[[nodiscard]] auto load_runtime_config(const global_options &global) -> runtime_config;

[[nodiscard]] auto open_runtime(const global_options &global) -> std::unique_ptr<runtime_store>;

// Prints the successful entries to out and every failure to err.
// Returns 0, or 125 if any container failed.
[[nodiscard]] auto report(const batch_result &result,
                          std::ostream &out = std::cout,
                          std::ostream &err = std::cerr) -> int;

} // namespace ctr_adapter::command
