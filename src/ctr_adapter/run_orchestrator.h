// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/container_handle.h"
#include "ctr_adapter/run_config.h"
#include "ctr_adapter/runtime_store.h"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

namespace ctr_adapter {

struct stdio_fds
{
    int input{ STDIN_FILENO };
    int output{ STDOUT_FILENO };
    int error{ STDERR_FILENO };
};

struct stream_selection
{
    bool input{ false };
    bool output{ true };
    bool error{ true };
};

// stdin takes part only in interactive mode, stdout and stderr always. An
// explicit attach list replaces that default entirely.
[[nodiscard]] auto select_streams(bool interactive,
                                  const std::optional<std::vector<std::string>> &attach)
        -> stream_selection;

inline constexpr int default_run_exit_code = 125;

// Drives a single "run": create, start detached or attached, wait for the
// exit code and optionally remove the container again.
class run_orchestrator
{
public:
    enum class state : std::uint8_t {
        initial,
        created,
        detached_start,
        attaching,
        running,
        exited,
        removed,
        retained,
    };

    run_orchestrator(runtime_store &store,
                     run_config config,
                     stdio_fds stdio = {},
                     std::ostream &out = std::cout);

    run_orchestrator(const run_orchestrator &) = delete;
    auto operator=(const run_orchestrator &) -> run_orchestrator & = delete;
    run_orchestrator(run_orchestrator &&) = delete;
    auto operator=(run_orchestrator &&) -> run_orchestrator & = delete;
    ~run_orchestrator() = default;

    // Returns the exit code for the calling shell. Throws only when the
    // container cannot be created or the attach selection is invalid; later
    // failures are logged and turned into an exit code.
    [[nodiscard]] auto run(int exit_code = default_run_exit_code) -> int;

    [[nodiscard]] auto current_state() const noexcept -> state { return state_; }

    [[nodiscard]] auto container() const noexcept -> const std::shared_ptr<container_handle> &
    {
        return container_;
    }

private:
    void transition(state next);
    void create();
    void log_cgroup_path() const;
    auto start_detached() -> int;
    // std::nullopt when the container ran to completion
    auto attach(const stream_selection &streams) -> std::optional<int>;
    auto wait_for_exit(int exit_code) -> int;
    void cleanup();

    runtime_store &store_;
    const run_config config_;
    stdio_fds stdio_;
    std::ostream &out_;
    std::shared_ptr<container_handle> container_;
    state state_{ state::initial };
};

auto to_string(run_orchestrator::state state) -> std::string;

} // namespace ctr_adapter
