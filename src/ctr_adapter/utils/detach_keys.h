// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ctr_adapter::utils {

inline constexpr std::string_view default_detach_keys = "ctrl-p,ctrl-q";

// Parses "ctrl-p,ctrl-q" style sequences, an empty string yields no keys.
auto parse_detach_keys(std::string_view keys) -> std::vector<unsigned char>;

// Scans a byte stream for the detach sequence. Bytes that may start the
// sequence are held back until the sequence either completes or breaks.
class detach_matcher
{
public:
    explicit detach_matcher(std::vector<unsigned char> keys);

    // Appends the bytes that should reach the container to forward,
    // returns true once the whole sequence has been seen.
    auto feed(const char *data, std::size_t size, std::string &forward) -> bool;

private:
    std::vector<unsigned char> keys_;
    std::size_t matched_{ 0 };
};

} // namespace ctr_adapter::utils
