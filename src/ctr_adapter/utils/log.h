// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <sstream>
#include <string_view>

#include <syslog.h>

namespace ctr_adapter::utils {

// CTR_ADAPTER_LOG_LEVEL takes a syslog priority, 7 enables debug output.
auto get_current_log_level() -> unsigned int;

// Messages are mirrored to stderr when it is a terminal or when
// CTR_ADAPTER_LOG_FORCE_STDERR is set.
auto log_to_stderr() -> bool;

// Tags every following message with the role of this process, e.g.
// "monitor" in the process that supervises a container.
void set_log_identity(std::string_view identity);
auto log_identity() -> const std::string &;

inline auto log_enabled(unsigned int level) -> bool
{
    return level <= get_current_log_level();
}

template<unsigned int level>
class Logger
{
public:
    Logger() = default;
    Logger(const Logger &) = delete;
    auto operator=(const Logger &) -> Logger & = delete;
    Logger(Logger &&) = delete;
    auto operator=(Logger &&) -> Logger & = delete;
    ~Logger() noexcept;

    template<typename T>
    auto operator<<(const T &value) -> Logger &
    {
        message << value;
        return *this;
    }

    auto operator<<(std::ostream &(*manipulator)(std::ostream &)) -> Logger &
    {
        manipulator(message);
        return *this;
    }

private:
    std::ostringstream message;
};

extern template class Logger<LOG_ERR>;
extern template class Logger<LOG_WARNING>;
extern template class Logger<LOG_INFO>;
extern template class Logger<LOG_DEBUG>;

} // namespace ctr_adapter::utils

#ifndef CTR_ADAPTER_LOG_ENABLE_SOURCE_LOCATION
#define CTR_ADAPTER_LOG_ENABLE_SOURCE_LOCATION 0
#endif

#define CTR_ADAPTER_STRINGIZE_DETAIL(x) #x
#define CTR_ADAPTER_STRINGIZE(x) CTR_ADAPTER_STRINGIZE_DETAIL(x)

#if CTR_ADAPTER_LOG_ENABLE_SOURCE_LOCATION
#define CTR_ADAPTER_LOG_SOURCE_LOCATION << __FILE__ ":" CTR_ADAPTER_STRINGIZE(__LINE__) ": "
#else
#define CTR_ADAPTER_LOG_SOURCE_LOCATION
#endif

#define CTR_ADAPTER_LOG(level)                                            \
    if (__builtin_expect(::ctr_adapter::utils::log_enabled(level), false)) \
    ::ctr_adapter::utils::Logger<level>() CTR_ADAPTER_LOG_SOURCE_LOCATION

#define CTR_ADAPTER_ERR() CTR_ADAPTER_LOG(LOG_ERR)
#define CTR_ADAPTER_WARNING() CTR_ADAPTER_LOG(LOG_WARNING)
#define CTR_ADAPTER_INFO() CTR_ADAPTER_LOG(LOG_INFO)
#define CTR_ADAPTER_DEBUG() CTR_ADAPTER_LOG(LOG_DEBUG)
