// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <string_view>

namespace ctr_adapter::utils {
auto str_to_signal(std::string_view str) -> int;

// Accepts "9", "KILL" or "SIGKILL".
auto parse_signal(std::string_view str) -> int;
} // namespace ctr_adapter::utils
