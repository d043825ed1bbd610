// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/impl/state_directory.h"
#include "ctr_adapter/runtime_store.h"

namespace ctr_adapter::impl {

// Containers of the local engine. Handles refer to the store, it has to
// outlive them.
class local_runtime final : public virtual runtime_store
{
public:
    explicit local_runtime(runtime_config config);

    [[nodiscard]] auto lookup(const std::string &id_or_name)
            -> std::shared_ptr<container_handle> override;
    [[nodiscard]] auto all() -> std::vector<std::shared_ptr<container_handle>> override;
    [[nodiscard]] auto latest() -> std::shared_ptr<container_handle> override;

    [[nodiscard]] auto create(const run_config &config)
            -> std::shared_ptr<container_handle> override;
    void remove(container_handle &container, bool force, bool remove_volumes) override;

    [[nodiscard]] auto config() const -> const runtime_config & override;

private:
    [[nodiscard]] auto make_handle(container_record record) -> std::shared_ptr<container_handle>;

    runtime_config config_;
    state_directory states;
};

static_assert(!std::is_abstract_v<local_runtime>);

} // namespace ctr_adapter::impl
