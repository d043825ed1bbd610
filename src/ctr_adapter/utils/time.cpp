// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/time.h"

#include "ctr_adapter/errors.h"

#include <cstdio>
#include <ctime>

namespace ctr_adapter::utils {

auto format_rfc3339_nano(std::chrono::system_clock::time_point tp) -> std::string
{
    auto since_epoch =
            std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    auto seconds = static_cast<std::time_t>(since_epoch / 1000000000);
    auto nanos = since_epoch % 1000000000;
    if (nanos < 0) {
        seconds -= 1;
        nanos += 1000000000;
    }

    std::tm tm{};
    if (::gmtime_r(&seconds, &tm) == nullptr) {
        throw error(error_kind::invalid_argument, "time out of range");
    }

    char buf[64]; // NOLINT
    auto len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + len, sizeof(buf) - len, ".%09lldZ", static_cast<long long>(nanos));
    return buf;
}

auto parse_rfc3339_nano(std::string_view str) -> std::chrono::system_clock::time_point
{
    const std::string text{ str };
    std::tm tm{};
    const char *rest = ::strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (rest == nullptr) {
        throw error(error_kind::parse_error, "invalid timestamp: " + text);
    }

    long long nanos{ 0 };
    if (*rest == '.') {
        ++rest;
        int digits{ 0 };
        while (*rest >= '0' && *rest <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (*rest - '0');
                ++digits;
            }
            ++rest;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    if (*rest != 'Z' || *(rest + 1) != '\0') {
        throw error(error_kind::parse_error, "timestamp is not in UTC: " + text);
    }

    auto seconds = ::timegm(&tm);
    return std::chrono::system_clock::time_point{ std::chrono::duration_cast<
            std::chrono::system_clock::duration>(std::chrono::seconds{ seconds }
                                                 + std::chrono::nanoseconds{ nanos }) };
}

} // namespace ctr_adapter::utils
