// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/run_orchestrator.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/exit_file.h"
#include "ctr_adapter/utils/log.h"

#include <algorithm>
#include <cctype>

namespace ctr_adapter {

auto select_streams(bool interactive, const std::optional<std::vector<std::string>> &attach)
        -> stream_selection
{
    stream_selection streams;
    streams.input = interactive;

    if (!attach) {
        return streams;
    }

    streams = stream_selection{ false, false, false };
    for (const auto &stream : *attach) {
        std::string name{ stream };
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (name == "stdout") {
            streams.output = true;
        } else if (name == "stderr") {
            streams.error = true;
        } else if (name == "stdin") {
            streams.input = true;
        } else {
            throw error(error_kind::invalid_argument,
                        "invalid stream \"" + stream
                                + "\" for --attach - must be one of stdin, stdout, or stderr");
        }
    }

    return streams;
}

auto to_string(run_orchestrator::state state) -> std::string
{
    switch (state) {
    case run_orchestrator::state::initial:
        return "initial";
    case run_orchestrator::state::created:
        return "created";
    case run_orchestrator::state::detached_start:
        return "detached-start";
    case run_orchestrator::state::attaching:
        return "attaching";
    case run_orchestrator::state::running:
        return "running";
    case run_orchestrator::state::exited:
        return "exited";
    case run_orchestrator::state::removed:
        return "removed";
    case run_orchestrator::state::retained:
        return "retained";
    }

    throw std::logic_error("unknown run state");
}

run_orchestrator::run_orchestrator(runtime_store &store,
                                   run_config config,
                                   stdio_fds stdio,
                                   std::ostream &out)
    : store_(store)
    , config_(std::move(config))
    , stdio_(stdio)
    , out_(out)
{
}

auto run_orchestrator::run(int exit_code) -> int
{
    if (state_ != state::initial) {
        throw std::logic_error("run_orchestrator::run called twice");
    }

    if (config_.detach) {
        create();
        return start_detached();
    }

    // reject a bad selection before anything exists that would need cleanup
    const auto streams = select_streams(config_.interactive, config_.attach);
    create();

    if (auto code = attach(streams)) {
        return *code;
    }

    exit_code = wait_for_exit(exit_code);
    cleanup();
    return exit_code;
}

void run_orchestrator::transition(state next)
{
    CTR_ADAPTER_DEBUG() << "run: " << to_string(state_) << " -> " << to_string(next);
    state_ = next;
}

void run_orchestrator::create()
{
    container_ = store_.create(config_);
    if (!container_) {
        throw std::runtime_error("engine returned no container");
    }

    transition(state::created);
    log_cgroup_path();
}

void run_orchestrator::log_cgroup_path() const
{
    if (!utils::log_enabled(LOG_DEBUG)) {
        return;
    }

    try {
        CTR_ADAPTER_DEBUG() << "container " << container_->id() << " has CgroupParent "
                            << container_->cgroup_path();
    } catch (const std::exception &e) {
        CTR_ADAPTER_DEBUG() << "no cgroup path for container " << container_->id() << ": "
                            << e.what();
    }
}

auto run_orchestrator::start_detached() -> int
{
    transition(state::detached_start);
    try {
        container_->start(config_.start_dependencies());
    } catch (const std::exception &e) {
        CTR_ADAPTER_ERR() << "failed to start container " << container_->id() << ": "
                          << e.what();
        return classify_start_failure(e);
    }

    out_ << container_->id() << '\n';
    out_.flush();
    return 0;
}

auto run_orchestrator::attach(const stream_selection &streams) -> std::optional<int>
{
    transition(state::attaching);

    attach_options options;
    options.input = streams.input ? stdio_.input : -1;
    options.output = streams.output ? stdio_.output : -1;
    options.error = streams.error ? stdio_.error : -1;
    options.detach_keys = config_.detach_keys;
    options.sig_proxy = config_.sig_proxy;
    options.start_dependencies = config_.start_dependencies();

    try {
        container_->start_and_attach(options);
        return std::nullopt;
    } catch (const std::exception &e) {
        // the user detached, leave the container alone and report success
        if (is(e, error_kind::detached)) {
            CTR_ADAPTER_DEBUG() << "detached from container " << container_->id();
            transition(state::retained);
            return 0;
        }

        const auto code = classify_start_failure(e);
        CTR_ADAPTER_ERR() << "failed to start and attach to container " << container_->id()
                          << ": " << e.what();

        if (!config_.remove) {
            transition(state::retained);
            return code;
        }

        try {
            store_.remove(*container_, true, false);
            transition(state::removed);
        } catch (const std::exception &remove_error) {
            CTR_ADAPTER_ERR() << "unable to remove container " << container_->id()
                              << " after failing to start and attach to it: "
                              << remove_error.what();
            transition(state::retained);
        }

        return code;
    }
}

auto run_orchestrator::wait_for_exit(int exit_code) -> int
{
    transition(state::running);

    try {
        exit_code = container_->wait();
    } catch (const std::exception &e) {
        if (is(e, error_kind::no_such_container)) {
            // removed behind our back, the engine may have left the exit code
            try {
                exit_code = read_exit_file(store_.config().tmp_dir, container_->id());
            } catch (const std::exception &read_error) {
                CTR_ADAPTER_ERR() << "Cannot get exit code: " << read_error.what();
                exit_code = exit_code_command_not_found;
            }
        } else {
            CTR_ADAPTER_DEBUG() << "waiting for container " << container_->id()
                                << " failed: " << e.what();
        }
    }

    transition(state::exited);
    return exit_code;
}

void run_orchestrator::cleanup()
{
    if (!config_.remove) {
        transition(state::retained);
        return;
    }

    try {
        store_.remove(*container_, false, true);
        transition(state::removed);
    } catch (const std::exception &e) {
        CTR_ADAPTER_DEBUG() << "failed to remove container " << container_->id() << ": "
                            << e.what();
        transition(state::retained);
    }
}

} // namespace ctr_adapter
