// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/log.h"

#include <cstdlib>
#include <iostream>
#include <string>

#include <unistd.h>

#ifndef CTR_ADAPTER_LOG_DEFAULT_LEVEL
#define CTR_ADAPTER_LOG_DEFAULT_LEVEL LOG_WARNING
#endif

namespace ctr_adapter::utils {

namespace {

auto identity_storage() -> std::string &
{
    static std::string identity{ "ctr-adapter" };
    return identity;
}

auto read_log_level() -> unsigned int
{
    const auto *env = ::getenv("CTR_ADAPTER_LOG_LEVEL");
    if (env == nullptr) {
        return CTR_ADAPTER_LOG_DEFAULT_LEVEL;
    }

    int value{ 0 };
    try {
        value = std::stoi(env);
    } catch (const std::logic_error &) {
        return CTR_ADAPTER_LOG_DEFAULT_LEVEL;
    }

    if (value < LOG_ERR) {
        return LOG_ERR;
    }

    return value > LOG_DEBUG ? LOG_DEBUG : static_cast<unsigned int>(value);
}

constexpr auto color_of(unsigned int level) -> const char *
{
    switch (level) {
    case LOG_ERR:
        return "\033[31m\033[1m";
    case LOG_WARNING:
        return "\033[33m\033[1m";
    case LOG_INFO:
        return "\033[34m";
    default:
        return "\033[0m";
    }
}

} // namespace

template<unsigned int level>
Logger<level>::~Logger() noexcept
{
    try {
        const auto text = message.str();
        const auto &identity = log_identity();

        ::syslog(level, "%s[%d]: %s", identity.c_str(), ::getpid(), text.c_str());

        if (log_to_stderr()) {
            std::cerr << color_of(level) << identity << '[' << ::getpid() << "] " << text
                      << "\033[0m" << std::endl;
        }
    } catch (const std::exception &e) {
        ::syslog(LOG_ERR, "failed to format log message: %s", e.what());
    }
}

template class Logger<LOG_ERR>;
template class Logger<LOG_WARNING>;
template class Logger<LOG_INFO>;
template class Logger<LOG_DEBUG>;

auto get_current_log_level() -> unsigned int
{
    static const unsigned int level = read_log_level();
    return level;
}

auto log_to_stderr() -> bool
{
    static const bool result =
            ::getenv("CTR_ADAPTER_LOG_FORCE_STDERR") != nullptr || ::isatty(STDERR_FILENO) != 0;
    return result;
}

void set_log_identity(std::string_view identity)
{
    identity_storage() = std::string{ identity };
}

auto log_identity() -> const std::string &
{
    return identity_storage();
}

} // namespace ctr_adapter::utils
