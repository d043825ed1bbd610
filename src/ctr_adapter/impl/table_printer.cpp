// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/table_printer.h"

#include "ctr_adapter/log_line.h"
#include "ctr_adapter/utils/time.h"

#include <algorithm>
#include <iomanip>

namespace {
constexpr int id_width = static_cast<int>(ctr_adapter::short_id_length) + 1;

auto exit_code_string(const ctr_adapter::container_record &record) -> std::string
{
    if (!record.exit_code) {
        return "-";
    }

    return std::to_string(*record.exit_code);
}
} // namespace

void ctr_adapter::impl::table_printer::print_containers(const std::vector<container_record> &records)
{
    int max_length = 4;
    for (const auto &r : records) {
        max_length = std::max(max_length, static_cast<int>(r.name.length()));
    }

    out << std::left << std::setw(id_width) << "CONTAINER ID"
        << std::setw(max_length + 1) << "NAME" << std::setw(11) << "STATUS" << std::setw(10)
        << "PID" << std::setw(10) << "EXIT CODE" << std::setw(0) << "CREATED" << '\n';
    for (const auto &r : records) {
        out << std::left << std::setw(id_width) << r.ID.substr(0, short_id_length)
            << std::setw(max_length + 1) << r.name << std::setw(11) << to_string(r.state)
            << std::setw(10) << r.PID << std::setw(10) << exit_code_string(r) << std::setw(0)
            << utils::format_rfc3339_nano(r.created) << '\n';
    }

    out.flush();
}
