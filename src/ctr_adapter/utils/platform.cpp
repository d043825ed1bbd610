// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/platform.h"

#include "ctr_adapter/errors.h"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <string>
#include <unordered_map>

namespace ctr_adapter::utils {
auto str_to_signal(std::string_view str) -> int
{
    // Only support standard signals for now
    const std::unordered_map<std::string_view, int> sigMap{
        { "SIGABRT", SIGABRT },   { "SIGALRM", SIGALRM }, { "SIGBUS", SIGBUS },
        { "SIGCHLD", SIGCHLD },   { "SIGCONT", SIGCONT }, { "SIGFPE", SIGFPE },
        { "SIGHUP", SIGHUP },     { "SIGILL", SIGILL },   { "SIGINT", SIGINT },
        { "SIGKILL", SIGKILL },   { "SIGPIPE", SIGPIPE }, { "SIGPOLL", SIGPOLL },
        { "SIGPROF", SIGPROF },   { "SIGPWR", SIGPWR },   { "SIGQUIT", SIGQUIT },
        { "SIGSEGV", SIGSEGV },   { "SIGSTOP", SIGSTOP }, { "SIGSYS", SIGSYS },
        { "SIGTERM", SIGTERM },   { "SIGTRAP", SIGTRAP }, { "SIGTSTP", SIGTSTP },
        { "SIGTTIN", SIGTTIN },   { "SIGTTOU", SIGTTOU }, { "SIGURG", SIGURG },
        { "SIGUSR1", SIGUSR1 },   { "SIGUSR2", SIGUSR2 }, { "SIGVTALRM", SIGVTALRM },
        { "SIGWINCH", SIGWINCH }, { "SIGXCPU", SIGXCPU }, { "SIGXFSZ", SIGXFSZ },
        { "SIGIO", SIGIO },       { "SIGIOT", SIGIOT },   { "SIGCLD", SIGCLD },
    };

    auto it = sigMap.find(str);
    if (it == sigMap.end()) {
        throw error(error_kind::invalid_argument, "invalid signal name: " + std::string{ str });
    }

    return it->second;
}

auto parse_signal(std::string_view str) -> int
{
    if (str.empty()) {
        throw error(error_kind::invalid_argument, "empty signal");
    }

    if (std::all_of(str.cbegin(), str.cend(), ::isdigit)) {
        auto sig = std::stoi(std::string{ str });
        if (sig <= 0 || sig > SIGRTMAX) {
            throw error(error_kind::invalid_argument,
                        "invalid signal number: " + std::string{ str });
        }
        return sig;
    }

    std::string name{ str };
    std::transform(name.begin(), name.end(), name.begin(), ::toupper);
    if (name.rfind("SIG", 0) == std::string::npos) {
        name.insert(0, "SIG");
    }

    return str_to_signal(name);
}
} // namespace ctr_adapter::utils
