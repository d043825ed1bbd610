// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/container_handle.h"

#include "ctr_adapter/errors.h"

namespace ctr_adapter {

auto to_string(container_state state) -> std::string
{
    switch (state) {
    case container_state::configured:
        return "configured";
    case container_state::running:
        return "running";
    case container_state::exited:
        return "exited";
    }

    throw std::logic_error("unknown status");
}

auto state_from_string(std::string_view state) -> container_state
{
    if (state == "configured") {
        return container_state::configured;
    }
    if (state == "running") {
        return container_state::running;
    }
    if (state == "exited") {
        return container_state::exited;
    }

    throw error(error_kind::parse_error, "unknown container state " + std::string{ state });
}

} // namespace ctr_adapter
