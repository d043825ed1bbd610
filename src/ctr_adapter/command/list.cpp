// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/command/list.h"

#include "ctr_adapter/command/common.h"
#include "ctr_adapter/impl/json_printer.h"
#include "ctr_adapter/impl/state_directory.h"
#include "ctr_adapter/impl/table_printer.h"

#include <algorithm>
#include <memory>

auto ctr_adapter::command::list(const global_options &global, const list_options &options) -> int
{
    impl::state_directory states{ load_runtime_config(global).root };

    std::unique_ptr<printer> printer;
    if (options.output_format == list_options::output_format_t::json) {
        printer = std::make_unique<impl::json_printer>();
    } else {
        printer = std::make_unique<impl::table_printer>();
    }

    auto records = states.list();
    std::sort(records.begin(), records.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.created < rhs.created;
    });

    printer->print_containers(records);
    return 0;
}
