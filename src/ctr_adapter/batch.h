// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/resolver.h"
#include "ctr_adapter/runtime_store.h"

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ctr_adapter {

// Outcome of a batch operation. Every resolved container ends up either in
// ok or in failures, never in both.
struct batch_result
{
    std::vector<std::string> ok;
    std::map<std::string, std::exception_ptr> failures;
};

// Returns the string recorded in batch_result::ok, throws on failure.
using batch_action = std::function<std::string(container_handle &)>;

// Runs action once per container. A failing container is recorded and the
// remaining ones are still attempted.
[[nodiscard]] auto execute(const container_list &containers, const batch_action &action)
        -> batch_result;

struct stop_request
{
    selection select;
    // when unset, the first container's own stop timeout is used for the
    // whole batch
    std::optional<unsigned int> timeout;
};

// The functions below throw only if the selection is malformed or does not
// resolve; per container failures are reported in the result.

[[nodiscard]] auto stop_containers(runtime_store &store, const stop_request &request)
        -> batch_result;

[[nodiscard]] auto kill_containers(runtime_store &store, const selection &select, int signal)
        -> batch_result;

// ok holds the exit codes of the containers, not their ids. Selecting all
// containers is rejected.
[[nodiscard]] auto wait_containers(runtime_store &store,
                                   const selection &select,
                                   std::chrono::milliseconds interval) -> batch_result;

} // namespace ctr_adapter
