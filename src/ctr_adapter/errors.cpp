// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/errors.h"

#include <cerrno>
#include <string_view>
#include <system_error>

namespace ctr_adapter {

auto to_string(error_kind kind) -> std::string
{
    switch (kind) {
    case error_kind::no_such_container:
        return "no such container";
    case error_kind::not_found:
        return "not found";
    case error_kind::invalid_argument:
        return "invalid argument";
    case error_kind::permission_denied:
        return "permission denied";
    case error_kind::io_error:
        return "input/output error";
    case error_kind::parse_error:
        return "parse error";
    case error_kind::container_stopped:
        return "container already stopped";
    case error_kind::invalid_state:
        return "container state improper";
    case error_kind::detached:
        return "detached from container";
    }

    throw std::logic_error("unknown error kind");
}

error::error(error_kind kind, const std::string &message)
    : std::runtime_error(message)
    , kind_(kind)
{
}

error::~error() noexcept = default;

auto kind_of(const std::exception &e) noexcept -> std::optional<error_kind>
{
    const auto *err = dynamic_cast<const error *>(&e);
    if (err == nullptr) {
        return std::nullopt;
    }

    return err->kind();
}

auto is(const std::exception &e, error_kind kind) noexcept -> bool
{
    return kind_of(e) == kind;
}

auto describe(const std::exception_ptr &e) -> std::string
{
    if (!e) {
        return "no error";
    }

    try {
        std::rethrow_exception(e);
    } catch (const std::exception &ex) {
        return ex.what();
    } catch (...) {
        return "unknown error";
    }
}

auto classify_start_failure(const std::exception &e) noexcept -> int
{
    if (is(e, error_kind::permission_denied)) {
        return exit_code_cannot_invoke;
    }

    if (const auto *sys = dynamic_cast<const std::system_error *>(&e); sys != nullptr) {
        const auto code = sys->code();
        if (code.category() == std::system_category()
            || code.category() == std::generic_category()) {
            if (code.value() == EACCES || code.value() == EPERM) {
                return exit_code_cannot_invoke;
            }
        }
    }

    // engines that only report text still get the same mapping
    if (std::string_view{ e.what() }.find("permission denied") != std::string_view::npos) {
        return exit_code_cannot_invoke;
    }

    return exit_code_command_not_found;
}

} // namespace ctr_adapter
