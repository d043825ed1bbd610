// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/container_handle.h"
#include "ctr_adapter/runtime_store.h"

#include <memory>
#include <string>
#include <vector>

namespace ctr_adapter {

using container_list = std::vector<std::shared_ptr<container_handle>>;

// Which containers a command operates on: "latest", "all" or explicit names.
struct selection
{
    bool all{ false };
    bool latest{ false };
    std::vector<std::string> names;
};

// Turns a selection into handles. latest wins over all, which wins over the
// names. Any name that does not resolve fails the whole call.
[[nodiscard]] auto resolve(runtime_store &store,
                           bool all,
                           bool latest,
                           const std::vector<std::string> &names) -> container_list;

[[nodiscard]] auto resolve(runtime_store &store, const selection &select) -> container_list;

// Batch commands take exactly one of the three modes.
void validate(const selection &select);

} // namespace ctr_adapter
