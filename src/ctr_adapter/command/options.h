// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/resolver.h"
#include "ctr_adapter/run_config.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ctr_adapter::command {

struct global_options
{
    std::optional<std::filesystem::path> root;
    std::optional<std::filesystem::path> tmp_dir;
    std::optional<std::string> runtime;
    std::optional<std::filesystem::path> config;
    int return_code{ 0 };
};

struct create_options
{
    run_config config;
    std::string stop_signal{ "TERM" };
};

struct run_options
{
    run_config config;
    std::string stop_signal{ "TERM" };
};

struct stop_options
{
    selection select;
    std::optional<unsigned int> timeout;
};

struct kill_options
{
    selection select;
    std::string signal{ "KILL" };
};

struct wait_options
{
    selection select;
    // milliseconds, the configured wait interval when unset
    std::optional<unsigned int> interval;
};

struct logs_options
{
    selection select;
    bool follow{ false };
    bool timestamps{ false };
    std::optional<std::size_t> tail;
};

struct list_options
{
    // FIXME: if the underlying type of enum class is std::uint8_t,
    //  the mapping message of CLI11 transformer is incorrect
    //  use std::uint16_t for now
    enum class output_format_t : std::uint16_t { table, json };

    output_format_t output_format{ output_format_t::table };
};

struct options
{
    using subcommand_opt_t = std::variant<std::monostate,
                                          create_options,
                                          run_options,
                                          stop_options,
                                          kill_options,
                                          wait_options,
                                          logs_options,
                                          list_options>;

    global_options global;
    subcommand_opt_t subcommand_opt;
};

auto parse(int argc, char *argv[]) -> options; // NOLINT

} // namespace ctr_adapter::command
