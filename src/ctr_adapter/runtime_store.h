// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/config.h"
#include "ctr_adapter/container_handle.h"
#include "ctr_adapter/interface.h"
#include "ctr_adapter/run_config.h"

#include <memory>
#include <string>
#include <vector>

namespace ctr_adapter {

// The container engine as seen from this layer. Implementations are
// expected to be safe against concurrent modification by other processes.
class runtime_store : public virtual interface
{
public:
    // Resolves an id, a name or an unambiguous id prefix.
    [[nodiscard]] virtual auto lookup(const std::string &id_or_name)
            -> std::shared_ptr<container_handle> = 0;
    [[nodiscard]] virtual auto all() -> std::vector<std::shared_ptr<container_handle>> = 0;
    // The most recently created container.
    [[nodiscard]] virtual auto latest() -> std::shared_ptr<container_handle> = 0;

    [[nodiscard]] virtual auto create(const run_config &config)
            -> std::shared_ptr<container_handle> = 0;
    virtual void remove(container_handle &container, bool force, bool remove_volumes) = 0;

    [[nodiscard]] virtual auto config() const -> const runtime_config & = 0;
};

} // namespace ctr_adapter
