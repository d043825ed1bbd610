// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/resolver.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/log.h"

#include <algorithm>

namespace ctr_adapter {

auto resolve(runtime_store &store,
             bool all,
             bool latest,
             const std::vector<std::string> &names) -> container_list
{
    if (latest) {
        auto container = store.latest();
        if (!container) {
            throw error(error_kind::no_such_container, "no containers to get latest of");
        }

        CTR_ADAPTER_DEBUG() << "latest container is " << container->id();
        return { std::move(container) };
    }

    if (all) {
        return store.all();
    }

    container_list containers;
    containers.reserve(names.size());
    for (const auto &name : names) {
        auto container = store.lookup(name);
        if (!container) {
            throw error(error_kind::no_such_container, "no such container " + name);
        }

        // an id and a name may both point at one container, act on it once
        const auto duplicate = std::any_of(containers.begin(),
                                           containers.end(),
                                           [&container](const auto &resolved) {
                                               return resolved->id() == container->id();
                                           });
        if (duplicate) {
            CTR_ADAPTER_DEBUG() << "skip repeated reference " << name << " to "
                                << container->id();
            continue;
        }

        containers.push_back(std::move(container));
    }

    return containers;
}

auto resolve(runtime_store &store, const selection &select) -> container_list
{
    return resolve(store, select.all, select.latest, select.names);
}

void validate(const selection &select)
{
    const int modes = (select.all ? 1 : 0) + (select.latest ? 1 : 0)
            + (select.names.empty() ? 0 : 1);

    if (modes == 0) {
        throw error(error_kind::invalid_argument,
                    "you must provide at least one container name or id");
    }

    if (modes > 1) {
        throw error(error_kind::invalid_argument,
                    "--all, --latest and container names are mutually exclusive");
    }
}

} // namespace ctr_adapter
