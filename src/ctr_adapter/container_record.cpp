// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/container_record.h"

#include "ctr_adapter/utils/time.h"

namespace ctr_adapter {

void to_json(nlohmann::json &j, const container_record &record)
{
    j = nlohmann::json::object({
            { "id", record.ID },
            { "name", record.name },
            { "bundle", record.bundle.string() },
            { "dependencies", record.dependencies },
            { "created", utils::format_rfc3339_nano(record.created) },
            { "stopTimeout", record.stop_timeout },
            { "stopSignal", record.stop_signal },
            { "cgroupParent", record.cgroup_parent },
            { "status", to_string(record.state) },
            { "monitorPid", record.monitor_PID },
            { "pid", record.PID },
            { "logPath", record.log_path.string() },
    });

    if (record.pod) {
        j["pod"] = *record.pod;
    }

    if (record.exit_code) {
        j["exitCode"] = *record.exit_code;
    }
}

void from_json(const nlohmann::json &j, container_record &record)
{
    record.ID = j.at("id").get<std::string>();
    record.name = j.at("name").get<std::string>();
    record.bundle = j.at("bundle").get<std::string>();
    record.dependencies = j.value("dependencies", std::vector<std::string>{});
    record.created = utils::parse_rfc3339_nano(j.at("created").get<std::string>());
    record.stop_timeout = j.value("stopTimeout", 10U);
    record.stop_signal = j.value("stopSignal", static_cast<int>(SIGTERM));
    record.cgroup_parent = j.value("cgroupParent", std::string{});
    record.state = state_from_string(j.at("status").get<std::string>());
    record.monitor_PID = j.value("monitorPid", -1);
    record.PID = j.value("pid", -1);
    record.log_path = j.value("logPath", std::string{});

    record.pod.reset();
    if (auto it = j.find("pod"); it != j.end()) {
        record.pod = it->get<std::string>();
    }

    record.exit_code.reset();
    if (auto it = j.find("exitCode"); it != j.end()) {
        record.exit_code = it->get<int>();
    }
}

} // namespace ctr_adapter
