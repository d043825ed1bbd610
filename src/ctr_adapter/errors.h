// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

namespace ctr_adapter {

enum class error_kind : std::uint8_t {
    no_such_container, // reference did not resolve, or the container vanished
    not_found,         // some other named resource, e.g. an exit file
    invalid_argument,
    permission_denied,
    io_error,
    parse_error,
    container_stopped,
    invalid_state,
    detached, // the user detached from an attach session
};

auto to_string(error_kind kind) -> std::string;

class error : public std::runtime_error
{
public:
    error(error_kind kind, const std::string &message);
    error(const error &) = default;
    error(error &&) noexcept = default;
    auto operator=(const error &) -> error & = default;
    auto operator=(error &&) noexcept -> error & = default;
    ~error() noexcept override;

    [[nodiscard]] auto kind() const noexcept -> error_kind { return kind_; }

private:
    error_kind kind_;
};

[[nodiscard]] auto kind_of(const std::exception &e) noexcept -> std::optional<error_kind>;

[[nodiscard]] auto is(const std::exception &e, error_kind kind) noexcept -> bool;

// Renders a stored failure for the user.
[[nodiscard]] auto describe(const std::exception_ptr &e) -> std::string;

inline constexpr int exit_code_cannot_invoke = 126;
inline constexpr int exit_code_command_not_found = 127;

// Maps a failure to start or attach to a shell style exit code: 126 when the
// failure is a permission problem, 127 otherwise.
[[nodiscard]] auto classify_start_failure(const std::exception &e) noexcept -> int;

} // namespace ctr_adapter
