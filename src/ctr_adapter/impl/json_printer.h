// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/printer.h"

#include <iostream>

namespace ctr_adapter::impl {

class json_printer final : public virtual ctr_adapter::printer
{
public:
    explicit json_printer(std::ostream &out = std::cout)
        : out(out)
    {
    }

    void print_containers(const std::vector<container_record> &records) final;

private:
    std::ostream &out;
};

static_assert(!std::is_abstract_v<json_printer>);

} // namespace ctr_adapter::impl
