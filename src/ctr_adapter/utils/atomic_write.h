// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <filesystem>
#include <string>

namespace ctr_adapter::utils {

void atomic_write(const std::filesystem::path &path, const std::string &content);

} // namespace ctr_adapter::utils
