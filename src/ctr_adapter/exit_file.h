// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <filesystem>
#include <string>

namespace ctr_adapter {

// Where the engine leaves the exit code of a container whose record has been
// purged: <tmp_dir>/exits/<id>-old
[[nodiscard]] auto exit_file_path(const std::filesystem::path &tmp_dir, const std::string &id)
        -> std::filesystem::path;

// Single attempt, throws error_kind::not_found, io_error or parse_error.
[[nodiscard]] auto read_exit_file(const std::filesystem::path &tmp_dir, const std::string &id)
        -> int;

} // namespace ctr_adapter
