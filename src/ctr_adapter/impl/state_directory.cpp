// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/state_directory.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/atomic_write.h"
#include "ctr_adapter/utils/log.h"
#include "ctr_adapter/utils/process.h"

#include <nlohmann/json.hpp>

#include <fstream>

namespace {

auto read_record(const std::filesystem::path &path) -> ctr_adapter::container_record
{
    nlohmann::json j;
    {
        std::ifstream istrm(path);
        if (istrm.fail()) {
            throw std::runtime_error("failed to open state file:" + path.string());
        }

        try {
            istrm >> j;
        } catch (const nlohmann::json::exception &e) {
            throw ctr_adapter::error(ctr_adapter::error_kind::parse_error,
                                     "invalid state file " + path.string() + ": " + e.what());
        }
    }

    ctr_adapter::container_record ret;
    try {
        ret = j.get<ctr_adapter::container_record>();
    } catch (const nlohmann::json::exception &e) {
        throw ctr_adapter::error(ctr_adapter::error_kind::parse_error,
                                 "invalid state file " + path.string() + ": " + e.what());
    }

    // the monitor died without recording the exit
    if (ret.state == ctr_adapter::container_state::running
        && !ctr_adapter::utils::process_alive(ret.monitor_PID)) {
        ret.state = ctr_adapter::container_state::exited;
    }

    return ret;
}

} // namespace

ctr_adapter::impl::state_directory::state_directory(const std::filesystem::path &root)
    : path(root / "containers")
{
    if (std::filesystem::is_directory(path) || std::filesystem::create_directories(path)) {
        return;
    }

    throw std::runtime_error("failed to create state directory " + path.string());
}

auto ctr_adapter::impl::state_directory::record_path(const std::string &id) const
        -> std::filesystem::path
{
    return this->path / (id + ".json");
}

void ctr_adapter::impl::state_directory::write(const container_record &record)
{
    const nlohmann::json j = record;
    utils::atomic_write(record_path(record.ID), j.dump());
}

auto ctr_adapter::impl::state_directory::read(const std::string &id) const -> container_record
{
    auto file = record_path(id);
    if (!std::filesystem::exists(file)) {
        throw error(error_kind::no_such_container, "no such container " + id);
    }

    return read_record(file);
}

void ctr_adapter::impl::state_directory::remove(const std::string &id)
{
    if (!std::filesystem::remove(record_path(id))) {
        throw error(error_kind::no_such_container, "no such container " + id);
    }
}

auto ctr_adapter::impl::state_directory::list() const -> std::vector<container_record>
{
    std::vector<container_record> ret;
    for (const auto &entry : std::filesystem::directory_iterator(this->path)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }

        try {
            ret.push_back(read_record(entry.path()));
        } catch (const std::exception &e) {
            CTR_ADAPTER_WARNING() << "Skip " << entry.path() << ": " << e.what();
            continue;
        }
    }

    return ret;
}
