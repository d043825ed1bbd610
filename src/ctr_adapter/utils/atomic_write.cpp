// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/atomic_write.h"

#include <fstream>

#include <unistd.h>

void ctr_adapter::utils::atomic_write(const std::filesystem::path &path, const std::string &content)
{
    // writers in different processes must not share a temporary file
    std::filesystem::path temp_path = path;
    temp_path += "." + std::to_string(::getpid()) + ".tmp";
    {
        std::ofstream temp_file(temp_path, std::ios::trunc);
        if (!temp_file.is_open()) {
            throw std::runtime_error("failed to open temporary file " + temp_path.string());
        }
        temp_file << content;
        temp_file.flush();
        if (!temp_file) {
            throw std::runtime_error("failed to write temporary file " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, path);
}
