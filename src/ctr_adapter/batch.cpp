// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/batch.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/log.h"

namespace ctr_adapter {

auto execute(const container_list &containers, const batch_action &action) -> batch_result
{
    batch_result result;
    for (const auto &container : containers) {
        const auto id = container->id();
        try {
            result.ok.push_back(action(*container));
        } catch (const std::exception &e) {
            CTR_ADAPTER_DEBUG() << "container " << id << ": " << e.what();
            result.failures[id] = std::current_exception();
        } catch (...) {
            CTR_ADAPTER_DEBUG() << "container " << id << ": unknown error";
            result.failures[id] = std::current_exception();
        }
    }

    return result;
}

auto stop_containers(runtime_store &store, const stop_request &request) -> batch_result
{
    validate(request.select);
    auto containers = resolve(store, request.select);

    // NOTE: the first container's default is reused for the rest of the batch,
    // containers with a different default stop timeout do not get their own.
    auto timeout = request.timeout;
    return execute(containers, [&timeout](container_handle &container) {
        if (!timeout) {
            timeout = container.stop_timeout();
            CTR_ADAPTER_DEBUG() << "Set timeout to container " << container.id() << " default ("
                                << *timeout << ")";
        }

        try {
            container.stop(*timeout);
        } catch (const error &e) {
            if (e.kind() != error_kind::container_stopped) {
                throw;
            }
            CTR_ADAPTER_DEBUG() << "Container " << container.id() << " is already stopped";
        }

        return container.id();
    });
}

auto kill_containers(runtime_store &store, const selection &select, int signal) -> batch_result
{
    validate(select);
    auto containers = resolve(store, select);

    return execute(containers, [signal](container_handle &container) {
        container.kill(signal);
        return container.id();
    });
}

auto wait_containers(runtime_store &store,
                     const selection &select,
                     std::chrono::milliseconds interval) -> batch_result
{
    if (select.all) {
        throw error(error_kind::invalid_argument, "cannot wait on all containers");
    }

    validate(select);
    auto containers = resolve(store, select);

    return execute(containers, [interval](container_handle &container) {
        return std::to_string(container.wait(interval));
    });
}

} // namespace ctr_adapter
