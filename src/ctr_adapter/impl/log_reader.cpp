// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/log_reader.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/log.h"

#include <deque>
#include <fstream>
#include <optional>
#include <thread>

namespace ctr_adapter::impl {

namespace {

class line_reader
{
public:
    line_reader(const std::filesystem::path &path, std::string cid)
        : path(path)
        , cid(std::move(cid))
    {
    }

    // Returns the next complete entry, std::nullopt when the writer has not
    // produced one yet.
    auto next() -> std::optional<log_line>
    {
        if (!open()) {
            return std::nullopt;
        }

        std::string text;
        while (read_line(text)) {
            log_line line;
            try {
                line = parse_log_line(text, cid);
            } catch (const error &e) {
                CTR_ADAPTER_WARNING() << "Skip line of " << path << ": " << e.what();
                continue;
            }

            if (line.partial) {
                partial += line.msg;
                continue;
            }

            if (!partial.empty()) {
                line.msg = partial + line.msg;
                partial.clear();
            }
            return line;
        }

        return std::nullopt;
    }

private:
    auto open() -> bool
    {
        if (file.is_open()) {
            return true;
        }

        // the monitor creates the file with the first line
        if (!std::filesystem::exists(path)) {
            return false;
        }

        file.open(path);
        if (!file.is_open()) {
            throw error(error_kind::io_error, "failed to open log file " + path.string());
        }
        return true;
    }

    auto read_line(std::string &text) -> bool
    {
        std::string chunk;
        if (!std::getline(file, chunk)) {
            file.clear();
            return false;
        }

        // no newline yet, keep what we have and retry later
        if (file.eof()) {
            fragment += chunk;
            file.clear();
            return false;
        }

        text = fragment + chunk;
        fragment.clear();
        return true;
    }

    std::filesystem::path path;
    std::string cid;
    std::ifstream file;
    std::string fragment;
    std::string partial;
};

} // namespace

void read_log_file(const std::filesystem::path &path,
                   const std::string &cid,
                   const log_options &options,
                   const std::function<void(log_line)> &sink,
                   const std::function<bool()> &finished,
                   std::chrono::milliseconds poll_interval)
{
    line_reader reader{ path, cid };

    if (options.tail) {
        std::deque<log_line> last;
        while (auto line = reader.next()) {
            if (*options.tail == 0) {
                continue;
            }
            if (last.size() == *options.tail) {
                last.pop_front();
            }
            last.push_back(std::move(*line));
        }

        for (auto &line : last) {
            sink(std::move(line));
        }
    }

    auto drain = [&reader, &sink]() {
        while (auto line = reader.next()) {
            sink(std::move(*line));
        }
    };

    if (!options.follow) {
        drain();
        return;
    }

    while (true) {
        const bool done = finished();
        drain();
        if (done) {
            break;
        }
        std::this_thread::sleep_for(poll_interval);
    }
}

} // namespace ctr_adapter::impl
