// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <cstdint>
#include <exception>
#include <type_traits>
#include <utility>

namespace ctr_adapter::utils {

// the cleanup function must not throw
template<typename Fn>
constexpr bool compatible_defer = std::is_nothrow_invocable_r_v<void, Fn>;

enum class defer_policy : std::uint8_t {
    always,  // run on every scope exit
    on_error // run only while an exception is unwinding the scope
};

template<typename Fn,
         defer_policy Policy = defer_policy::always,
         std::enable_if_t<compatible_defer<Fn>, bool> = true>
struct defer
{
    explicit defer(Fn &&fn) noexcept
        : fn(std::move(fn))
        , uncaught(std::uncaught_exceptions())
    {
    }

    defer(const defer &) = delete;
    defer &operator=(const defer &) = delete;
    defer(defer &&other) = delete;
    defer &operator=(defer &&other) = delete;

    ~defer() noexcept
    {
        if (cancelled) {
            return;
        }

        if constexpr (Policy == defer_policy::always) {
            fn();
        } else if constexpr (Policy == defer_policy::on_error) {
            if (std::uncaught_exceptions() > uncaught) {
                fn();
            }
        }
    }

    void cancel() noexcept { cancelled = true; }

private:
    Fn fn;
    int uncaught;
    bool cancelled{ false };
};

template<typename Fn>
auto make_defer(Fn &&fn) noexcept
{
    return defer<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

// Exceptions report failures in this project, so cleanup of partially built
// state is expressed as an errdefer that only fires while unwinding.
template<typename Fn>
auto make_errdefer(Fn &&fn) noexcept
{
    return defer<std::decay_t<Fn>, defer_policy::on_error>(std::forward<Fn>(fn));
}

} // namespace ctr_adapter::utils
