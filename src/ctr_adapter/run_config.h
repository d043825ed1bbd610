// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <csignal>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ctr_adapter {

// Everything "run" and "create" need, fixed before the container is created.
struct run_config
{
    // creation
    std::string name;
    std::filesystem::path bundle;
    std::optional<std::string> pod;
    std::optional<unsigned int> stop_timeout;
    int stop_signal{ SIGTERM };
    std::string cgroup_parent;

    // execution
    bool detach{ false };
    bool interactive{ false };
    // replaces the default stream selection when set
    std::optional<std::vector<std::string>> attach;
    bool sig_proxy{ true };
    bool remove{ false };
    std::string detach_keys{ "ctrl-p,ctrl-q" };

    // start the other containers of the pod first
    [[nodiscard]] auto start_dependencies() const noexcept -> bool { return pod.has_value(); }
};

} // namespace ctr_adapter
