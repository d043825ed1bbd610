// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/log_line.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace ctr_adapter::impl {

// Reads a log file written by the monitor. In follow mode the file is polled
// until finished() reports that no writer is left; the lines written before
// that are still delivered.
void read_log_file(const std::filesystem::path &path,
                   const std::string &cid,
                   const log_options &options,
                   const std::function<void(log_line)> &sink,
                   const std::function<bool()> &finished,
                   std::chrono::milliseconds poll_interval);

} // namespace ctr_adapter::impl
