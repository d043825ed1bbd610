// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace ctr_adapter {

struct runtime_config
{
    // container records and logs
    std::filesystem::path root;
    // holds exits/, where the engine leaves exit codes of finished containers
    std::filesystem::path tmp_dir;
    std::string oci_runtime{ "ll-box" };
    unsigned int stop_timeout{ 10 };
    std::chrono::milliseconds wait_interval{ 250 };
};

// Values given on the command line, they win over the configuration file.
struct config_overrides
{
    std::optional<std::filesystem::path> root;
    std::optional<std::filesystem::path> tmp_dir;
    std::optional<std::string> oci_runtime;
};

auto default_root() -> std::filesystem::path;

void from_json(const nlohmann::json &j, runtime_config &config);

// Builds the configuration from defaults, the optional JSON file and the
// command line overrides, in that order.
auto load_config(const std::optional<std::filesystem::path> &file,
                 const config_overrides &overrides) -> runtime_config;

} // namespace ctr_adapter
