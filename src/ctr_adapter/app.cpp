// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/app.h"

#include "ctr_adapter/command/create.h"
#include "ctr_adapter/command/kill.h"
#include "ctr_adapter/command/list.h"
#include "ctr_adapter/command/logs.h"
#include "ctr_adapter/command/run.h"
#include "ctr_adapter/command/stop.h"
#include "ctr_adapter/command/wait.h"
#include "ctr_adapter/utils/log.h"

#include <sstream>

namespace {

template<typename... T>
struct subCommand : T...
{
    using T::operator()...;
};

template<typename... T>
subCommand(T...) -> subCommand<T...>;

} // namespace

namespace ctr_adapter {

auto main(int argc, char **argv) noexcept -> int
try {
    CTR_ADAPTER_DEBUG() << "ctr-adapter called with" << [=]() -> std::string {
        std::stringstream result;
        for (int i = 0; i < argc; ++i) {
            result << " \"";
            for (const char *c = argv[i]; *c != '\0'; ++c) {
                if (*c == '\\') {
                    result << "\\\\";
                } else if (*c == '"') {
                    result << "\\\"";
                } else {
                    result << *c;
                }
            }
            result << "\"";
        }
        return result.str();
    }();

    command::options options = command::parse(argc, argv);
    if (options.global.return_code != 0) {
        return options.global.return_code;
    }

    const auto &global = options.global;
    return std::visit(
            subCommand{
                    [&global](const command::create_options &options) {
                        return command::create(global, options);
                    },
                    [&global](const command::run_options &options) {
                        return command::run(global, options);
                    },
                    [&global](const command::stop_options &options) {
                        return command::stop(global, options);
                    },
                    [&global](const command::kill_options &options) {
                        return command::kill(global, options);
                    },
                    [&global](const command::wait_options &options) {
                        return command::wait(global, options);
                    },
                    [&global](const command::logs_options &options) {
                        return command::logs(global, options);
                    },
                    [&global](const command::list_options &options) {
                        return command::list(global, options);
                    },
                    [code = options.global.return_code](const std::monostate &) {
                        return code;
                    } },
            options.subcommand_opt);
} catch (const std::exception &e) {
    CTR_ADAPTER_ERR() << "Error: " << e.what();
    return -1;
} catch (...) {
    CTR_ADAPTER_ERR() << "unknown error";
    return -1;
}

} // namespace ctr_adapter
