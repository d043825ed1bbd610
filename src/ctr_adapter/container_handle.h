// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/interface.h"
#include "ctr_adapter/log_line.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace ctr_adapter {

enum class container_state : std::uint8_t { configured, running, exited };

auto to_string(container_state state) -> std::string;
auto state_from_string(std::string_view state) -> container_state;

struct attach_options
{
    // -1 means the stream does not take part in the session
    int input{ -1 };
    int output{ -1 };
    int error{ -1 };
    std::string detach_keys;
    bool sig_proxy{ true };
    bool start_dependencies{ false };
};

// A container managed by the runtime store. Handles do not own the
// container, and the container may disappear while a handle is in use, in
// which case operations throw error_kind::no_such_container.
class container_handle : public virtual interface
{
public:
    [[nodiscard]] virtual auto id() const -> const std::string & = 0;
    [[nodiscard]] virtual auto name() const -> const std::string & = 0;
    [[nodiscard]] virtual auto state() const -> container_state = 0;
    [[nodiscard]] virtual auto created() const -> std::chrono::system_clock::time_point = 0;
    [[nodiscard]] virtual auto stop_timeout() const -> unsigned int = 0;
    [[nodiscard]] virtual auto cgroup_path() const -> std::string = 0;

    virtual void start(bool start_dependencies) = 0;

    // Starts the container and wires the selected streams to it. Returns once
    // the container has exited, throws error_kind::detached when the user
    // typed the detach sequence.
    virtual void start_and_attach(const attach_options &options) = 0;

    // Throws error_kind::container_stopped if the container is not running.
    virtual void stop(unsigned int timeout) = 0;
    virtual void kill(int signal) = 0;

    [[nodiscard]] virtual auto wait() -> int = 0;
    [[nodiscard]] virtual auto wait(std::chrono::milliseconds interval) -> int = 0;

    // Blocks until the requested lines have been handed to sink, in follow
    // mode until the container has exited.
    virtual void read_log(const log_options &options,
                          const std::function<void(log_line)> &sink) = 0;
};

} // namespace ctr_adapter
