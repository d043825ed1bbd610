// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/detach_keys.h"

#include "ctr_adapter/errors.h"

#include <algorithm>
#include <cctype>

namespace ctr_adapter::utils {

namespace {

auto parse_one(std::string_view key) -> unsigned char
{
    if (key.size() == 1) {
        return static_cast<unsigned char>(key.front());
    }

    std::string lower{ key };
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    constexpr std::string_view prefix = "ctrl-";
    if (lower.size() != prefix.size() + 1 || lower.rfind(prefix, 0) != 0) {
        throw error(error_kind::invalid_argument,
                    "invalid detach key: " + std::string{ key });
    }

    auto c = lower.back();
    if (c >= 'a' && c <= 'z') {
        return static_cast<unsigned char>(c - 'a' + 1);
    }

    switch (c) {
    case '@':
        return 0;
    case '[':
        return 27;
    case '\\':
        return 28;
    case ']':
        return 29;
    case '^':
        return 30;
    case '_':
        return 31;
    default:
        throw error(error_kind::invalid_argument,
                    "invalid detach key: " + std::string{ key });
    }
}

} // namespace

auto parse_detach_keys(std::string_view keys) -> std::vector<unsigned char>
{
    std::vector<unsigned char> result;
    while (!keys.empty()) {
        auto pos = keys.find(',');
        result.push_back(parse_one(keys.substr(0, pos)));
        if (pos == std::string_view::npos) {
            break;
        }
        keys.remove_prefix(pos + 1);
        if (keys.empty()) {
            throw error(error_kind::invalid_argument, "trailing comma in detach keys");
        }
    }

    return result;
}

detach_matcher::detach_matcher(std::vector<unsigned char> keys)
    : keys_(std::move(keys))
{
}

auto detach_matcher::feed(const char *data, std::size_t size, std::string &forward) -> bool
{
    if (keys_.empty()) {
        forward.append(data, size);
        return false;
    }

    for (std::size_t i = 0; i < size; ++i) {
        auto c = static_cast<unsigned char>(data[i]);
        if (c == keys_[matched_]) {
            if (++matched_ == keys_.size()) {
                matched_ = 0;
                return true;
            }
            continue;
        }

        // release the held back prefix, the current byte may start a new match
        forward.append(keys_.begin(), keys_.begin() + static_cast<std::ptrdiff_t>(matched_));
        matched_ = 0;
        if (c == keys_.front()) {
            matched_ = 1;
            continue;
        }
        forward.push_back(static_cast<char>(c));
    }

    return false;
}

} // namespace ctr_adapter::utils
