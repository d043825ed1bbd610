// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/container_record.h"
#include "ctr_adapter/interface.h"

#include <vector>

namespace ctr_adapter {
class state_directory : public virtual interface
{
public:
    virtual void write(const container_record &record) = 0;
    // throws error_kind::no_such_container when there is no record
    [[nodiscard]] virtual auto read(const std::string &id) const -> container_record = 0;
    virtual void remove(const std::string &id) = 0;
    [[nodiscard]] virtual auto list() const -> std::vector<container_record> = 0;
};
} // namespace ctr_adapter
