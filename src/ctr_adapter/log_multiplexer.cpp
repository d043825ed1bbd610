// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/log_multiplexer.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/channel.h"
#include "ctr_adapter/utils/defer.h"
#include "ctr_adapter/utils/log.h"
#include "ctr_adapter/utils/wait_group.h"

#include <thread>
#include <vector>

namespace ctr_adapter {

auto log_buffer_capacity(std::optional<std::size_t> tail, std::size_t containers) -> std::size_t
{
    return tail.value_or(0) * containers + 1;
}

log_multiplexer::log_multiplexer(container_list containers, log_options options)
    : containers_(std::move(containers))
    , options_(options)
    , capacity_(log_buffer_capacity(options.tail, containers_.size()))
{
    options_.multi = containers_.size() > 1;
}

void log_multiplexer::stream(const std::function<void(const log_line &)> &consumer)
{
    utils::channel<log_line> lines(capacity_);
    utils::wait_group producers;
    std::vector<std::thread> threads;
    threads.reserve(containers_.size() + 1);

    auto join_all = utils::make_defer([&threads]() noexcept {
        for (auto &thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    });
    // unblocks producers if we bail out before draining
    auto close_on_error = utils::make_errdefer([&lines]() noexcept { lines.close(); });

    for (const auto &container : containers_) {
        producers.add();
        try {
            threads.emplace_back([this, container, &lines, &producers]() {
                auto done = utils::make_defer([&producers]() noexcept { producers.done(); });
                try {
                    container->read_log(options_,
                                        [&lines](log_line line) { lines.push(std::move(line)); });
                } catch (const std::exception &e) {
                    CTR_ADAPTER_ERR() << "failed to read logs of container " << container->id()
                                      << ": " << e.what();
                }
            });
        } catch (const std::system_error &) {
            producers.done();
            throw;
        }
    }

    // the buffer is closed only once every producer has finished
    threads.emplace_back([&lines, &producers]() {
        producers.wait();
        lines.close();
    });

    while (auto line = lines.pop()) {
        consumer(*line);
    }
}

void log_multiplexer::stream(std::ostream &out)
{
    stream([this, &out](const log_line &line) { out << to_string(line, options_) << '\n'; });
    out.flush();
}

void stream_logs(runtime_store &store,
                 const selection &select,
                 log_options options,
                 std::ostream &out)
{
    if (select.all) {
        throw error(error_kind::invalid_argument, "--all is not supported for logs");
    }

    validate(select);
    log_multiplexer multiplexer(resolve(store, select), options);
    multiplexer.stream(out);
}

} // namespace ctr_adapter
