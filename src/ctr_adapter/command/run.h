// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/command/options.h"

namespace ctr_adapter::command {

[[nodiscard]] auto run(const global_options &global, const run_options &options) -> int;

} // namespace ctr_adapter::command
