// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/json_printer.h"

#include "ctr_adapter/utils/time.h"

#include <nlohmann/json.hpp>

namespace {
nlohmann::json record_to_json(const ctr_adapter::container_record &record)
{
    auto j = nlohmann::json::object({
            { "id", record.ID },
            { "name", record.name },
            { "status", ctr_adapter::to_string(record.state) },
            { "pid", record.PID },
            { "bundle", record.bundle.string() },
            { "created", ctr_adapter::utils::format_rfc3339_nano(record.created) },
    });

    if (record.exit_code) {
        j["exitCode"] = *record.exit_code;
    }
    if (record.pod) {
        j["pod"] = *record.pod;
    }

    return j;
}
} // namespace

void ctr_adapter::impl::json_printer::print_containers(const std::vector<container_record> &records)
{
    auto j = nlohmann::json::array();
    for (const auto &r : records) {
        j += record_to_json(r);
    }

    out << j.dump(4) << std::endl;
}
