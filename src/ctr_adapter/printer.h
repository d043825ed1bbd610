// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/container_record.h"
#include "ctr_adapter/interface.h"

#include <vector>

namespace ctr_adapter {
class printer : public virtual interface
{
protected:
    printer() = default;

public:
    ~printer() override;

    printer(const printer &) = delete;
    auto operator=(const printer &) -> printer & = delete;
    printer(printer &&) = delete;
    auto operator=(printer &&) -> printer & = delete;

    virtual void print_containers(const std::vector<container_record> &records) = 0;
};
} // namespace ctr_adapter
