// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/container_handle.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace ctr_adapter {

// What the local engine persists about a container.
struct container_record
{
    std::string ID;
    std::string name;
    std::filesystem::path bundle;
    std::optional<std::string> pod;
    // started before this one when dependencies are requested
    std::vector<std::string> dependencies;
    std::chrono::system_clock::time_point created;
    unsigned int stop_timeout{ 10 };
    int stop_signal{ SIGTERM };
    std::string cgroup_parent;

    container_state state{ container_state::configured };
    pid_t monitor_PID{ -1 };
    // the OCI runtime process, signals for the container go here
    pid_t PID{ -1 };
    std::optional<int> exit_code;
    std::filesystem::path log_path;
};

void to_json(nlohmann::json &j, const container_record &record);
void from_json(const nlohmann::json &j, container_record &record);

} // namespace ctr_adapter
