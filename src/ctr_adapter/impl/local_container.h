// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/config.h"
#include "ctr_adapter/container_handle.h"
#include "ctr_adapter/container_record.h"
#include "ctr_adapter/state_directory.h"

namespace ctr_adapter::impl {

// A container of the local engine. Only the immutable part of the record is
// cached, everything else is read from the state directory on each call.
class local_container final : public virtual container_handle
{
public:
    local_container(ctr_adapter::state_directory &states,
                    const runtime_config &config,
                    container_record record);

    [[nodiscard]] auto id() const -> const std::string & override;
    [[nodiscard]] auto name() const -> const std::string & override;
    [[nodiscard]] auto state() const -> container_state override;
    [[nodiscard]] auto created() const -> std::chrono::system_clock::time_point override;
    [[nodiscard]] auto stop_timeout() const -> unsigned int override;
    [[nodiscard]] auto cgroup_path() const -> std::string override;

    void start(bool start_dependencies) override;
    void start_and_attach(const attach_options &options) override;
    void stop(unsigned int timeout) override;
    void kill(int signal) override;

    [[nodiscard]] auto wait() -> int override;
    [[nodiscard]] auto wait(std::chrono::milliseconds interval) -> int override;

    void read_log(const log_options &options,
                  const std::function<void(log_line)> &sink) override;

    [[nodiscard]] auto current() const -> container_record;

private:
    auto prepare_start(bool start_dependencies) -> container_record;
    [[nodiscard]] auto wait_until_exited(std::chrono::steady_clock::time_point deadline) const
            -> bool;

    ctr_adapter::state_directory &states;
    const runtime_config &config;
    container_record record;
};

static_assert(!std::is_abstract_v<local_container>);

} // namespace ctr_adapter::impl
