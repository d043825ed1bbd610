// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace ctr_adapter {

struct log_options
{
    bool follow{ false };
    bool timestamps{ false };
    // prefix every line with the short id of the container that wrote it
    bool multi{ false };
    // number of trailing lines per container, std::nullopt for all of them
    std::optional<std::size_t> tail;
};

struct log_line
{
    std::chrono::system_clock::time_point time;
    std::string device{ "stdout" };
    bool partial{ false };
    std::string msg;
    std::string cid;
};

inline constexpr std::size_t short_id_length = 12;

[[nodiscard]] auto to_string(const log_line &line, const log_options &options) -> std::string;

// Parses one line of the k8s-file log format: "<time> <stream> <F|P> <msg>".
[[nodiscard]] auto parse_log_line(std::string_view text, const std::string &cid) -> log_line;

[[nodiscard]] auto format_log_line(const log_line &line) -> std::string;

} // namespace ctr_adapter
