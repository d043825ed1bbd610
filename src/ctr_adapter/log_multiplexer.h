// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include "ctr_adapter/log_line.h"
#include "ctr_adapter/resolver.h"
#include "ctr_adapter/runtime_store.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>

namespace ctr_adapter {

// Enough room for the replayed tail of every container, plus one.
[[nodiscard]] auto log_buffer_capacity(std::optional<std::size_t> tail, std::size_t containers)
        -> std::size_t;

// Fans the logs of several containers into one stream. One producer thread
// per container; lines of one container keep their order, lines of different
// containers interleave freely.
class log_multiplexer
{
public:
    log_multiplexer(container_list containers, log_options options);

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    [[nodiscard]] auto options() const noexcept -> const log_options & { return options_; }

    // Hands every line to consumer and returns once all producers are done
    // and the buffer is drained.
    void stream(const std::function<void(const log_line &)> &consumer);

    void stream(std::ostream &out);

private:
    container_list containers_;
    log_options options_;
    std::size_t capacity_;
};

// "logs": resolves latest or explicit names and prints their merged output.
void stream_logs(runtime_store &store,
                 const selection &select,
                 log_options options,
                 std::ostream &out);

} // namespace ctr_adapter
