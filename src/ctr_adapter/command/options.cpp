// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/options.h"

#include "ctr_adapter/utils/detach_keys.h"

#include "CLI/CLI.hpp"

namespace {

void add_creation_options(CLI::App *cmd, ctr_adapter::run_config &config, std::string &stop_signal)
{
    cmd->add_option("--name", config.name, "Assign a name to the container");
    cmd->add_option("--pod", config.pod, "Run the container in an existing pod");
    cmd->add_option("--stop-timeout",
                    config.stop_timeout,
                    "Timeout in seconds to stop the container, the engine default if unset");
    cmd->add_option("--stop-signal", stop_signal, "Signal to stop the container")
            ->type_name("SIGNAL")
            ->capture_default_str();
    cmd->add_option("--cgroup-parent",
                    config.cgroup_parent,
                    "Optional parent cgroup for the container");
    cmd->add_option("BUNDLE", config.bundle, "Path to the OCI bundle")->required();
}

void add_selection_options(CLI::App *cmd, ctr_adapter::selection &select, bool with_all = true)
{
    if (with_all) {
        cmd->add_flag("-a,--all", select.all, "Act on all containers");
    }
    cmd->add_flag("-l,--latest", select.latest, "Act on the latest container the engine knows");
    cmd->add_option("CONTAINER", select.names, "Container IDs or names");
}

} // namespace

auto ctr_adapter::command::parse(int argc, char *argv[]) -> options // NOLINT
{
    CLI::App app{ "Manage the lifecycle of OCI containers.", "ctr-adapter" };
    argv = app.ensure_utf8(argv);

    options options;

    app.add_option("--root", options.global.root, "Root directory for storage of container state")
            ->type_name("PATH");
    app.add_option("--tmpdir", options.global.tmp_dir, "Directory for temporary runtime files")
            ->type_name("PATH");
    app.add_option("--runtime", options.global.runtime, "OCI runtime used to run containers")
            ->type_name("PATH");
    app.add_option("--config", options.global.config, "JSON configuration file")
            ->type_name("FILE")
            ->check(CLI::ExistingFile);

    app.require_subcommand(1);

    create_options create;
    auto *cmd_create = app.add_subcommand("create", "Create but do not start a container");
    add_creation_options(cmd_create, create.config, create.stop_signal);

    run_options run;
    auto *cmd_run = app.add_subcommand("run", "Create and start a container");
    add_creation_options(cmd_run, run.config, run.stop_signal);
    cmd_run->add_flag("-d,--detach", run.config.detach, "Run container in background and print its ID");
    cmd_run->add_flag("-i,--interactive", run.config.interactive, "Keep STDIN open");
    cmd_run->add_option("-a,--attach",
                        run.config.attach,
                        "Attach to STDIN, STDOUT or STDERR")
            ->type_name("STREAM")
            ->delimiter(',')
            ->allow_extra_args(false);
    cmd_run->add_flag("--sig-proxy",
                      run.config.sig_proxy,
                      "Proxy received signals to the process")
            ->capture_default_str();
    cmd_run->add_flag("--rm", run.config.remove, "Remove container after exit");
    cmd_run->add_option("--detach-keys",
                        run.config.detach_keys,
                        "Key sequence for detaching a container, empty to disable")
            ->default_str(std::string{ utils::default_detach_keys });

    stop_options stop;
    auto *cmd_stop = app.add_subcommand("stop", "Stop one or more containers");
    add_selection_options(cmd_stop, stop.select);
    cmd_stop->add_option("-t,--time,--timeout",
                         stop.timeout,
                         "Seconds to wait for stop before killing the container");

    kill_options kill;
    auto *cmd_kill = app.add_subcommand("kill", "Kill one or more running containers");
    add_selection_options(cmd_kill, kill.select);
    cmd_kill->add_option("-s,--signal", kill.signal, "Signal to send to the container")
            ->type_name("SIGNAL")
            ->capture_default_str();

    wait_options wait;
    auto *cmd_wait = app.add_subcommand("wait", "Block on one or more containers");
    add_selection_options(cmd_wait, wait.select, false);
    cmd_wait->add_option("-i,--interval", wait.interval, "Milliseconds to wait before polling")
            ->type_name("MS");

    logs_options logs;
    auto *cmd_logs = app.add_subcommand("logs", "Fetch the logs of one or more containers");
    add_selection_options(cmd_logs, logs.select, false);
    cmd_logs->add_flag("-f,--follow", logs.follow, "Follow log output");
    cmd_logs->add_flag("-t,--timestamps", logs.timestamps, "Output the timestamps in the log");
    cmd_logs->add_option("--tail", logs.tail, "Output the specified number of lines at the end");

    list_options list;
    auto *cmd_list = app.add_subcommand("list", "List known containers");
    cmd_list->add_option("-f,--format", list.output_format, "Specify the output format")
            ->type_name("FORMAT")
            ->transform(CLI::CheckedTransformer(
                    std::unordered_map<std::string_view, list_options::output_format_t>{
                            { "json", list_options::output_format_t::json },
                            { "table", list_options::output_format_t::table },
                    }))
            ->default_val(list_options::output_format_t::table);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        options.global.return_code = app.exit(e);
        return options;
    }

    if (cmd_create->parsed()) {
        options.subcommand_opt = std::move(create);
    } else if (cmd_run->parsed()) {
        options.subcommand_opt = std::move(run);
    } else if (cmd_stop->parsed()) {
        options.subcommand_opt = std::move(stop);
    } else if (cmd_kill->parsed()) {
        options.subcommand_opt = std::move(kill);
    } else if (cmd_wait->parsed()) {
        options.subcommand_opt = std::move(wait);
    } else if (cmd_logs->parsed()) {
        options.subcommand_opt = std::move(logs);
    } else if (cmd_list->parsed()) {
        options.subcommand_opt = std::move(list);
    }

    return options;
}
