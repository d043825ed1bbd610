// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/local_container.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/impl/log_reader.h"
#include "ctr_adapter/impl/monitor.h"
#include "ctr_adapter/utils/defer.h"
#include "ctr_adapter/utils/detach_keys.h"
#include "ctr_adapter/utils/file_describer.h"
#include "ctr_adapter/utils/log.h"
#include "ctr_adapter/utils/process.h"
#include "ctr_adapter/utils/signal.h"

#include <array>
#include <cerrno>
#include <cstring>
#include <optional>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <sys/signalfd.h>

namespace {

constexpr auto stop_poll_interval = std::chrono::milliseconds(100);

void send_signal(pid_t pid, int signal)
{
    if (::kill(pid, signal) == 0) {
        return;
    }

    if (errno == ESRCH) {
        CTR_ADAPTER_DEBUG() << "process " << pid << " is gone";
        return;
    }

    throw std::system_error(errno,
                            std::system_category(),
                            "failed to send signal " + std::to_string(signal) + " to "
                                    + std::to_string(pid));
}

// One output stream of an attach session: the pipe the monitor writes to and
// the descriptor of the caller it ends up on.
struct attached_output
{
    std::optional<ctr_adapter::utils::file_descriptor> pipe;
    int target{ -1 };
};

void copy_output(attached_output &out, pollfd &poll_fd)
{
    std::array<char, 8192> buf{};
    std::size_t n{ 0 };
    auto status = out.pipe->read_some(buf.data(), buf.size(), n);
    if (status == ctr_adapter::utils::file_descriptor::IOStatus::TryAgain) {
        return;
    }

    if (status == ctr_adapter::utils::file_descriptor::IOStatus::Eof) {
        poll_fd.fd = -1;
        out.pipe.reset();
        return;
    }

    if (out.target < 0) {
        return;
    }

    try {
        ctr_adapter::utils::file_descriptor(out.target, false).write_all(buf.data(), n);
    } catch (const std::system_error &e) {
        CTR_ADAPTER_DEBUG() << "stop copying container output: " << e.what();
        out.target = -1;
    }
}

} // namespace

ctr_adapter::impl::local_container::local_container(ctr_adapter::state_directory &states,
                                                    const runtime_config &config,
                                                    container_record record)
    : states(states)
    , config(config)
    , record(std::move(record))
{
}

auto ctr_adapter::impl::local_container::id() const -> const std::string &
{
    return record.ID;
}

auto ctr_adapter::impl::local_container::name() const -> const std::string &
{
    return record.name;
}

auto ctr_adapter::impl::local_container::current() const -> container_record
{
    return states.read(record.ID);
}

auto ctr_adapter::impl::local_container::state() const -> container_state
{
    return current().state;
}

auto ctr_adapter::impl::local_container::created() const -> std::chrono::system_clock::time_point
{
    return record.created;
}

auto ctr_adapter::impl::local_container::stop_timeout() const -> unsigned int
{
    return record.stop_timeout;
}

auto ctr_adapter::impl::local_container::cgroup_path() const -> std::string
{
    if (record.cgroup_parent.empty()) {
        throw error(error_kind::not_found, "container " + record.ID + " has no cgroup parent");
    }

    return record.cgroup_parent + "/" + record.ID;
}

auto ctr_adapter::impl::local_container::prepare_start(bool start_dependencies)
        -> container_record
{
    auto current = this->current();
    if (current.state == container_state::running) {
        throw error(error_kind::invalid_state, "container " + record.ID + " is already running");
    }

    if (start_dependencies) {
        for (const auto &dependency : current.dependencies) {
            local_container container{ states, config, states.read(dependency) };
            if (container.state() == container_state::running) {
                continue;
            }

            CTR_ADAPTER_INFO() << "start dependency " << dependency << " of " << record.ID;
            container.start(false);
        }
    }

    // an exit code left by a previous run must not be mistaken for this one
    std::error_code ec;
    std::filesystem::remove(config.tmp_dir / "exits" / record.ID, ec);
    if (ec) {
        CTR_ADAPTER_WARNING() << "failed to remove old exit file of " << record.ID << ": "
                              << ec.message();
    }

    return current;
}

void ctr_adapter::impl::local_container::start(bool start_dependencies)
{
    auto current = prepare_start(start_dependencies);
    spawn_monitor(current, states, config, monitor_stdio{});
}

void ctr_adapter::impl::local_container::start_and_attach(const attach_options &options)
{
    // no keys, no detaching
    utils::detach_matcher matcher{ utils::parse_detach_keys(options.detach_keys) };

    auto current = prepare_start(options.start_dependencies);

    sigset_t set;
    utils::sigemptyset(set);
    utils::sigaddset(set, SIGCHLD);
    utils::sigaddset(set, SIGPIPE);
    if (options.sig_proxy) {
        for (auto signal : { SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2 }) {
            utils::sigaddset(set, signal);
        }
    }

    sigset_t old_set;
    utils::sigprocmask(SIG_BLOCK, set, &old_set);
    auto restore_mask = utils::make_defer([&old_set]() noexcept {
        if (::sigprocmask(SIG_SETMASK, &old_set, nullptr) < 0) {
            CTR_ADAPTER_ERR() << "failed to restore signal mask: " << ::strerror(errno);
        }
    });

    auto signal_fd = utils::create_signalfd(set);

    monitor_stdio stdio;
    std::optional<utils::file_descriptor> stdin_reader;
    std::optional<utils::file_descriptor> stdin_writer;
    if (options.input >= 0) {
        auto fds = utils::pipe(O_CLOEXEC);
        stdin_reader = std::move(fds.first);
        stdin_writer = std::move(fds.second);
        stdio.input = stdin_reader->get();
        stdio.caller_only.push_back(stdin_writer->get());
    }

    std::array<attached_output, 2> outputs;
    std::array<int, 2> targets{ options.output, options.error };
    std::array<int *, 2> monitor_ends{ &stdio.output, &stdio.error };
    std::array<std::optional<utils::file_descriptor>, 2> writers;
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        if (targets[i] < 0) {
            continue;
        }

        auto fds = utils::pipe(O_CLOEXEC);
        outputs[i].pipe = std::move(fds.first);
        outputs[i].target = targets[i];
        writers[i] = std::move(fds.second);
        *monitor_ends[i] = writers[i]->get();
        stdio.caller_only.push_back(outputs[i].pipe->get());
    }

    auto monitor = spawn_monitor(current, states, config, stdio);

    // the monitor holds its own copies now
    stdin_reader.reset();
    for (auto &writer : writers) {
        writer.reset();
    }

    std::array<pollfd, 4> fds{
        pollfd{ signal_fd.get(), POLLIN, 0 },
        pollfd{ stdin_writer ? options.input : -1, POLLIN, 0 },
        pollfd{ outputs[0].pipe ? outputs[0].pipe->get() : -1, POLLIN, 0 },
        pollfd{ outputs[1].pipe ? outputs[1].pipe->get() : -1, POLLIN, 0 },
    };

    bool reaped{ false };
    std::array<char, 4096> buf{};
    while (!reaped || fds[2].fd >= 0 || fds[3].fd >= 0) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::system_category(), "poll");
        }

        if ((fds[0].revents & POLLIN) != 0) {
            signalfd_siginfo info{};
            while (signal_fd.read(info) == utils::file_descriptor::IOStatus::Success) {
                const auto signo = static_cast<int>(info.ssi_signo);
                if (signo == SIGCHLD) {
                    auto result = utils::waitpid(monitor, WNOHANG);
                    reaped = reaped || result.status != utils::WaitStatus::None;
                    continue;
                }

                if (signo == SIGPIPE) {
                    continue;
                }

                CTR_ADAPTER_DEBUG() << "forward signal " << signo << " to " << record.ID;
                send_signal(this->current().PID, signo);
            }
        }

        if (fds[1].fd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
            std::size_t n{ 0 };
            auto status =
                    utils::file_descriptor(options.input, false).read_some(buf.data(), buf.size(), n);
            if (status == utils::file_descriptor::IOStatus::Eof) {
                // the container sees EOF too
                fds[1].fd = -1;
                stdin_writer.reset();
            } else if (status == utils::file_descriptor::IOStatus::Success) {
                std::string forward;
                const bool detach = matcher.feed(buf.data(), n, forward);
                try {
                    stdin_writer->write_all(forward.data(), forward.size());
                } catch (const std::system_error &e) {
                    CTR_ADAPTER_DEBUG() << "stop forwarding input: " << e.what();
                    fds[1].fd = -1;
                    stdin_writer.reset();
                }

                if (detach) {
                    throw error(error_kind::detached, "detached from container " + record.ID);
                }
            }
        }

        for (std::size_t i = 0; i < outputs.size(); ++i) {
            auto &poll_fd = fds[i + 2];
            if (poll_fd.fd >= 0 && (poll_fd.revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                copy_output(outputs[i], poll_fd);
            }
        }
    }
}

auto ctr_adapter::impl::local_container::wait_until_exited(
        std::chrono::steady_clock::time_point deadline) const -> bool
{
    while (true) {
        if (current().state != container_state::running) {
            return true;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }

        std::this_thread::sleep_for(stop_poll_interval);
    }
}

void ctr_adapter::impl::local_container::stop(unsigned int timeout)
{
    auto current = this->current();
    if (current.state != container_state::running) {
        throw error(error_kind::container_stopped, "container " + record.ID + " is not running");
    }

    if (timeout > 0) {
        send_signal(current.PID, current.stop_signal);
        if (wait_until_exited(std::chrono::steady_clock::now() + std::chrono::seconds(timeout))) {
            return;
        }

        CTR_ADAPTER_WARNING() << "container " << record.ID << " did not stop within " << timeout
                              << " seconds, killing it";
    }

    send_signal(current.PID, SIGKILL);
    wait_until_exited(std::chrono::steady_clock::time_point::max());
}

void ctr_adapter::impl::local_container::kill(int signal)
{
    auto current = this->current();
    if (current.state != container_state::running) {
        throw error(error_kind::invalid_state,
                    "can only kill running containers, " + record.ID + " is "
                            + to_string(current.state));
    }

    send_signal(current.PID, signal);
}

auto ctr_adapter::impl::local_container::wait() -> int
{
    return wait(config.wait_interval);
}

auto ctr_adapter::impl::local_container::wait(std::chrono::milliseconds interval) -> int
{
    while (true) {
        auto current = this->current();
        if (current.state == container_state::exited) {
            if (!current.exit_code) {
                throw error(error_kind::not_found,
                            "no exit code recorded for container " + record.ID);
            }
            return *current.exit_code;
        }

        std::this_thread::sleep_for(interval);
    }
}

void ctr_adapter::impl::local_container::read_log(const log_options &options,
                                                  const std::function<void(log_line)> &sink)
{
    auto finished = [this]() {
        try {
            return current().state != container_state::running;
        } catch (const error &e) {
            if (e.kind() != error_kind::no_such_container) {
                throw;
            }
            return true;
        }
    };

    read_log_file(record.log_path, record.ID, options, sink, finished, config.wait_interval);
}
