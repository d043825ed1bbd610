// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/exit_file.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/log.h"

#include <charconv>
#include <fstream>
#include <iterator>
#include <system_error>

namespace ctr_adapter {

auto exit_file_path(const std::filesystem::path &tmp_dir, const std::string &id)
        -> std::filesystem::path
{
    return tmp_dir / "exits" / (id + "-old");
}

auto read_exit_file(const std::filesystem::path &tmp_dir, const std::string &id) -> int
{
    const auto path = exit_file_path(tmp_dir, id);

    CTR_ADAPTER_DEBUG() << "Attempting to read container " << id << " exit code from file "
                        << path;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw error(error_kind::io_error,
                        "error getting exit file for container " + id + ": " + ec.message());
        }
        throw error(error_kind::not_found, "error getting exit file for container " + id);
    }

    std::ifstream istrm(path);
    if (!istrm.is_open()) {
        throw error(error_kind::io_error, "error opening exit file for container " + id);
    }

    std::string content;
    try {
        content.assign(std::istreambuf_iterator<char>(istrm), std::istreambuf_iterator<char>());
    } catch (const std::ios_base::failure &e) {
        throw error(error_kind::io_error,
                    "error reading exit file for container " + id + ": " + e.what());
    }

    if (istrm.bad()) {
        throw error(error_kind::io_error, "error reading exit file for container " + id);
    }

    // tolerate the trailing newline shell tools leave behind
    const auto first = content.find_first_not_of(" \t\r\n");
    const auto last = content.find_last_not_of(" \t\r\n");
    const std::string_view text = first == std::string::npos
            ? std::string_view{}
            : std::string_view{ content }.substr(first, last - first + 1);

    if (text.empty()) {
        throw error(error_kind::parse_error, "exit file for container " + id + " is empty");
    }

    int code{ 0 };
    const auto *end = text.data() + text.size();
    auto [ptr, parse_ec] = std::from_chars(text.data(), end, code);
    if (parse_ec != std::errc{} || ptr != end) {
        throw error(error_kind::parse_error,
                    "error parsing exit code for container " + id + ": \"" + content + "\"");
    }

    return code;
}

} // namespace ctr_adapter
