// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/state_directory.h"

#include <filesystem>
#include <vector>

namespace ctr_adapter::impl {
class state_directory final : public virtual ctr_adapter::state_directory
{
public:
    explicit state_directory(const std::filesystem::path &root);

    void write(const container_record &record) override;
    [[nodiscard]] auto read(const std::string &id) const -> container_record override;
    void remove(const std::string &id) override;
    [[nodiscard]] auto list() const -> std::vector<container_record> override;

private:
    [[nodiscard]] auto record_path(const std::string &id) const -> std::filesystem::path;

    std::filesystem::path path;
};

static_assert(!std::is_abstract_v<state_directory>);

} // namespace ctr_adapter::impl
