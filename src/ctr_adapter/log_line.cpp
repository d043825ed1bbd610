// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/log_line.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/time.h"

#include <string_view>

namespace ctr_adapter {

auto to_string(const log_line &line, const log_options &options) -> std::string
{
    std::string out;
    if (options.multi) {
        out += line.cid.substr(0, short_id_length);
        out += ' ';
    }

    if (options.timestamps) {
        out += utils::format_rfc3339_nano(line.time);
        out += ' ';
    }

    return out + line.msg;
}

auto parse_log_line(std::string_view text, const std::string &cid) -> log_line
{
    auto next_field = [&text]() -> std::string_view {
        auto pos = text.find(' ');
        if (pos == std::string_view::npos) {
            throw error(error_kind::parse_error,
                        "malformed log line: " + std::string{ text });
        }
        auto field = text.substr(0, pos);
        text.remove_prefix(pos + 1);
        return field;
    };

    log_line line;
    line.cid = cid;
    line.time = utils::parse_rfc3339_nano(next_field());
    line.device = std::string{ next_field() };

    // the message may be empty, in which case the tag is the last field
    std::string_view tag;
    if (text.size() == 1) {
        tag = text;
        text = {};
    } else {
        tag = next_field();
    }

    if (tag == "P") {
        line.partial = true;
    } else if (tag != "F") {
        throw error(error_kind::parse_error, "unknown log tag: " + std::string{ tag });
    }

    line.msg = std::string{ text };
    return line;
}

auto format_log_line(const log_line &line) -> std::string
{
    return utils::format_rfc3339_nano(line.time) + ' ' + line.device + ' '
            + (line.partial ? "P" : "F") + ' ' + line.msg;
}

} // namespace ctr_adapter
