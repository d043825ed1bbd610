// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/local_runtime.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/impl/local_container.h"
#include "ctr_adapter/utils/log.h"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace {

auto generate_id() -> std::string
{
    std::random_device device;
    std::mt19937_64 engine{ (static_cast<std::uint64_t>(device()) << 32U) | device() };

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (int i = 0; i < 4; ++i) {
        stream << std::setw(16) << engine();
    }
    return stream.str();
}

auto is_prefix(const std::string &prefix, const std::string &id) -> bool
{
    return id.size() >= prefix.size() && id.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

ctr_adapter::impl::local_runtime::local_runtime(runtime_config config)
    : config_(std::move(config))
    , states(config_.root)
{
}

auto ctr_adapter::impl::local_runtime::config() const -> const runtime_config &
{
    return config_;
}

auto ctr_adapter::impl::local_runtime::make_handle(container_record record)
        -> std::shared_ptr<container_handle>
{
    return std::make_shared<local_container>(states, config_, std::move(record));
}

auto ctr_adapter::impl::local_runtime::lookup(const std::string &id_or_name)
        -> std::shared_ptr<container_handle>
{
    if (id_or_name.empty()) {
        throw error(error_kind::invalid_argument, "empty container reference");
    }

    auto records = states.list();

    auto it = std::find_if(records.begin(), records.end(), [&id_or_name](const auto &record) {
        return record.ID == id_or_name;
    });
    if (it == records.end()) {
        it = std::find_if(records.begin(), records.end(), [&id_or_name](const auto &record) {
            return record.name == id_or_name;
        });
    }
    if (it != records.end()) {
        return make_handle(std::move(*it));
    }

    std::vector<container_record> matches;
    std::copy_if(records.begin(),
                 records.end(),
                 std::back_inserter(matches),
                 [&id_or_name](const auto &record) {
                     return is_prefix(id_or_name, record.ID);
                 });

    if (matches.empty()) {
        throw error(error_kind::no_such_container, "no such container " + id_or_name);
    }

    if (matches.size() > 1) {
        throw error(error_kind::invalid_argument,
                    "more than one container matches " + id_or_name
                            + ", use a longer prefix");
    }

    return make_handle(std::move(matches.front()));
}

auto ctr_adapter::impl::local_runtime::all() -> std::vector<std::shared_ptr<container_handle>>
{
    auto records = states.list();
    std::sort(records.begin(), records.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.created < rhs.created;
    });

    std::vector<std::shared_ptr<container_handle>> ret;
    ret.reserve(records.size());
    for (auto &record : records) {
        ret.push_back(make_handle(std::move(record)));
    }
    return ret;
}

auto ctr_adapter::impl::local_runtime::latest() -> std::shared_ptr<container_handle>
{
    auto records = states.list();
    auto it = std::max_element(records.begin(), records.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.created < rhs.created;
    });
    if (it == records.end()) {
        throw error(error_kind::no_such_container, "no containers to act on");
    }

    return make_handle(std::move(*it));
}

auto ctr_adapter::impl::local_runtime::create(const run_config &config)
        -> std::shared_ptr<container_handle>
{
    if (config.bundle.empty()) {
        throw error(error_kind::invalid_argument, "a bundle is required to create a container");
    }

    auto bundle = std::filesystem::absolute(config.bundle);
    if (!std::filesystem::exists(bundle / "config.json")) {
        throw error(error_kind::invalid_argument,
                    "bundle " + bundle.string() + " has no config.json");
    }

    auto records = states.list();
    if (!config.name.empty()) {
        auto taken = std::any_of(records.begin(), records.end(), [&config](const auto &record) {
            return record.name == config.name;
        });
        if (taken) {
            throw error(error_kind::invalid_state,
                        "the container name " + config.name + " is already in use");
        }
    }

    container_record record;
    record.ID = generate_id();
    record.name = config.name.empty() ? "ctr-" + record.ID.substr(0, short_id_length)
                                      : config.name;
    record.bundle = bundle;
    record.pod = config.pod;
    record.created = std::chrono::system_clock::now();
    record.stop_timeout = config.stop_timeout.value_or(config_.stop_timeout);
    record.stop_signal = config.stop_signal;
    record.cgroup_parent = config.cgroup_parent;
    record.log_path = config_.root / "logs" / (record.ID + ".log");

    if (config.pod) {
        for (const auto &other : records) {
            if (other.pod == config.pod) {
                record.dependencies.push_back(other.ID);
            }
        }
    }

    states.write(record);
    CTR_ADAPTER_INFO() << "created container " << record.ID << " (" << record.name << ")";

    return make_handle(std::move(record));
}

void ctr_adapter::impl::local_runtime::remove(container_handle &container,
                                              bool force,
                                              bool remove_volumes)
{
    const auto &id = container.id();
    auto record = states.read(id);

    if (record.state == container_state::running) {
        if (!force) {
            throw error(error_kind::invalid_state,
                        "cannot remove running container " + id + ", stop it first");
        }

        try {
            container.stop(0);
        } catch (const error &e) {
            if (e.kind() != error_kind::container_stopped) {
                throw;
            }
        }
    }

    if (remove_volumes) {
        CTR_ADAPTER_DEBUG() << "container " << id << " has no volumes managed here";
    }

    // keep the exit code for whoever is still waiting on the container
    auto exits = config_.tmp_dir / "exits";
    if (std::filesystem::exists(exits / id)) {
        std::filesystem::rename(exits / id, exits / (id + "-old"));
    }

    states.remove(id);

    std::error_code ec;
    std::filesystem::remove(record.log_path, ec);
    if (ec) {
        CTR_ADAPTER_WARNING() << "failed to remove log of " << id << ": " << ec.message();
    }

    CTR_ADAPTER_INFO() << "removed container " << id;
}
