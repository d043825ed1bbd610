// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <chrono>
#include <string>
#include <string_view>

namespace ctr_adapter::utils {

// RFC 3339 with nanoseconds in UTC, e.g. 2024-01-02T03:04:05.000000006Z
auto format_rfc3339_nano(std::chrono::system_clock::time_point tp) -> std::string;

auto parse_rfc3339_nano(std::string_view str) -> std::chrono::system_clock::time_point;

} // namespace ctr_adapter::utils
