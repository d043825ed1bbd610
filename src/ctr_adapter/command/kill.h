// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/command/options.h"

namespace ctr_adapter::command {

[[nodiscard]] auto kill(const global_options &global, const kill_options &options) -> int;

} // namespace ctr_adapter::command
