// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/monitor.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/log_line.h"
#include "ctr_adapter/utils/atomic_write.h"
#include "ctr_adapter/utils/file_describer.h"
#include "ctr_adapter/utils/log.h"
#include "ctr_adapter/utils/process.h"
#include "ctr_adapter/utils/signal.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace ctr_adapter::impl {

namespace {

// One stream of the container: the pipe we read, the attached descriptor we
// copy to, and the incomplete line waiting for its newline.
struct output_stream
{
    const char *device;
    utils::file_descriptor pipe;
    int attached{ -1 };
    std::string pending;
};

class log_writer
{
public:
    explicit log_writer(const std::filesystem::path &path)
        : file(path, std::ios::app)
    {
        if (!file.is_open()) {
            throw std::runtime_error("failed to open log file " + path.string());
        }
    }

    void write(const char *device, std::string msg, bool partial)
    {
        log_line line;
        line.time = std::chrono::system_clock::now();
        line.device = device;
        line.partial = partial;
        line.msg = std::move(msg);
        file << format_log_line(line) << '\n';
        file.flush();
    }

private:
    std::ofstream file;
};

void copy_chunk(output_stream &stream, log_writer &log, const char *data, std::size_t size)
{
    if (stream.attached >= 0) {
        try {
            utils::file_descriptor(stream.attached, false).write_all(data, size);
        } catch (const std::system_error &e) {
            // the caller went away, keep logging
            CTR_ADAPTER_DEBUG() << "stop copying " << stream.device << ": " << e.what();
            stream.attached = -1;
        }
    }

    stream.pending.append(data, size);
    std::string::size_type start{ 0 };
    for (auto pos = stream.pending.find('\n'); pos != std::string::npos;
         pos = stream.pending.find('\n', start)) {
        log.write(stream.device, stream.pending.substr(start, pos - start), false);
        start = pos + 1;
    }
    stream.pending.erase(0, start);
}

void pump(std::array<output_stream, 2> &streams, log_writer &log)
{
    std::array<pollfd, 2> fds{};
    for (std::size_t i = 0; i < streams.size(); ++i) {
        fds[i] = pollfd{ streams[i].pipe.get(), POLLIN, 0 };
    }

    std::array<char, 8192> buf{};
    auto open_streams = streams.size();
    while (open_streams > 0) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::system_category(), "poll");
        }

        for (std::size_t i = 0; i < streams.size(); ++i) {
            if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            std::size_t n{ 0 };
            auto status = streams[i].pipe.read_some(buf.data(), buf.size(), n);
            if (status == utils::file_descriptor::IOStatus::Success) {
                copy_chunk(streams[i], log, buf.data(), n);
                continue;
            }

            if (status == utils::file_descriptor::IOStatus::Eof) {
                if (!streams[i].pending.empty()) {
                    log.write(streams[i].device, std::move(streams[i].pending), false);
                    streams[i].pending.clear();
                }
                fds[i].fd = -1;
                --open_streams;
            }
        }
    }
}

[[noreturn]] void exec_runtime(const container_record &record,
                               const runtime_config &config,
                               int input,
                               const utils::file_descriptor &out,
                               const utils::file_descriptor &err,
                               const utils::file_descriptor &exec_status) noexcept
{
    [&]() noexcept {
        try {
            if (input >= 0) {
                utils::file_descriptor(input, false).duplicate_to(STDIN_FILENO, 0);
            } else {
                utils::file_descriptor null{ ::open("/dev/null", O_RDONLY | O_CLOEXEC) };
                null.duplicate_to(STDIN_FILENO, 0);
            }
            out.duplicate_to(STDOUT_FILENO, 0);
            err.duplicate_to(STDERR_FILENO, 0);
        } catch (const std::system_error &e) {
            const int code = e.code().value();
            (void)::write(exec_status.get(), &code, sizeof(code));
            ::_exit(exit_code_cannot_invoke);
        }

        const auto bundle = record.bundle.string();
        std::array<const char *, 6> argv{
            config.oci_runtime.c_str(), "run", "--bundle", bundle.c_str(), record.ID.c_str(),
            nullptr,
        };

        // ignored dispositions survive exec
        ::signal(SIGPIPE, SIG_DFL);
        ::execvp(argv[0], const_cast<char *const *>(argv.data())); // NOLINT

        const int code = errno;
        (void)::write(exec_status.get(), &code, sizeof(code));
        ::_exit(code == ENOENT ? exit_code_command_not_found : exit_code_cannot_invoke);
    }();
    ::_exit(exit_code_command_not_found);
}

void record_exit(container_record record,
                 state_directory &states,
                 const runtime_config &config,
                 int exit_code)
{
    auto exits = config.tmp_dir / "exits";
    std::filesystem::create_directories(exits);
    utils::atomic_write(exits / record.ID, std::to_string(exit_code));

    try {
        record = states.read(record.ID);
    } catch (const error &e) {
        if (e.kind() != error_kind::no_such_container) {
            throw;
        }
        // removed while running, the exit file is all that is left
        CTR_ADAPTER_DEBUG() << "container " << record.ID << " removed before it exited";
        return;
    }

    record.state = container_state::exited;
    record.exit_code = exit_code;
    record.PID = -1;
    states.write(record);
}

[[noreturn]] void run_monitor(container_record record,
                              state_directory &states,
                              const runtime_config &config,
                              const monitor_stdio &stdio,
                              utils::file_descriptor exec_status) noexcept
{
    [&]() noexcept {
        try {
            // the caller may have blocked signals for its attach loop
            sigset_t none;
            utils::sigemptyset(none);
            utils::sigprocmask(SIG_SETMASK, none, nullptr);
            ::signal(SIGPIPE, SIG_IGN);

            for (auto fd : stdio.caller_only) {
                ::close(fd);
            }

            // keep terminal signals away, the caller forwards what it wants
            if (::setsid() < 0) {
                throw std::system_error(errno, std::system_category(), "setsid");
            }
            utils::set_log_identity("ctr-adapter-monitor:" + record.ID.substr(0, 12));

            auto [out_r, out_w] = utils::pipe(O_CLOEXEC);
            auto [err_r, err_w] = utils::pipe(O_CLOEXEC);

            auto pid = ::fork();
            if (pid < 0) {
                throw std::system_error(errno, std::system_category(), "fork");
            }

            if (pid == 0) {
                exec_runtime(record, config, stdio.input, out_w, err_w, exec_status);
            }

            out_w.release();
            err_w.release();

            record.state = container_state::running;
            record.monitor_PID = ::getpid();
            record.PID = pid;
            record.exit_code.reset();
            states.write(record);

            // the caller returns from start once this is closed
            exec_status.release();

            log_writer log{ record.log_path };
            std::array<output_stream, 2> streams{
                output_stream{ "stdout", std::move(out_r), stdio.output, {} },
                output_stream{ "stderr", std::move(err_r), stdio.error, {} },
            };
            pump(streams, log);

            auto result = utils::waitpid(pid, 0);
            const auto exit_code = result.status == utils::WaitStatus::Reaped
                    ? utils::decode_wait_status(result.exit_code)
                    : exit_code_command_not_found;
            CTR_ADAPTER_DEBUG() << "container " << record.ID << " exited with " << exit_code;

            record_exit(record, states, config, exit_code);
        } catch (const std::exception &e) {
            CTR_ADAPTER_ERR() << "monitor of container " << record.ID << " failed: " << e.what();
            ::_exit(1);
        }
        ::_exit(0);
    }();
    ::_exit(1);
}

} // namespace

auto spawn_monitor(const container_record &record,
                   state_directory &states,
                   const runtime_config &config,
                   const monitor_stdio &stdio) -> pid_t
{
    if (!record.log_path.empty()) {
        std::filesystem::create_directories(record.log_path.parent_path());
    }

    auto [status_r, status_w] = utils::pipe(O_CLOEXEC);

    auto pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno, std::system_category(), "fork");
    }

    if (pid == 0) {
        status_r.release();
        run_monitor(record, states, config, stdio, std::move(status_w));
    }

    status_w.release();

    // EOF: the runtime was executed; an int: the errno of the failed exec
    int code{ 0 };
    auto status = status_r.read(code);
    if (status == utils::file_descriptor::IOStatus::Success) {
        throw std::system_error(code,
                                std::system_category(),
                                "failed to execute OCI runtime " + config.oci_runtime);
    }

    CTR_ADAPTER_DEBUG() << "monitor " << pid << " started container " << record.ID;
    return pid;
}

} // namespace ctr_adapter::impl
