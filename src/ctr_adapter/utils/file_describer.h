// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <unistd.h>

namespace ctr_adapter::utils {

class file_descriptor_invalid_exception : public std::runtime_error
{
public:
    explicit file_descriptor_invalid_exception(const std::string &message);
    file_descriptor_invalid_exception(const file_descriptor_invalid_exception &) = default;
    file_descriptor_invalid_exception(file_descriptor_invalid_exception &&) noexcept = default;
    auto operator=(const file_descriptor_invalid_exception &)
            -> file_descriptor_invalid_exception & = default;
    auto operator=(file_descriptor_invalid_exception &&) noexcept
            -> file_descriptor_invalid_exception & = default;
    ~file_descriptor_invalid_exception() noexcept override;
};

class file_descriptor
{
public:
    enum class IOStatus : uint8_t { Success, TryAgain, Eof };

    file_descriptor() = default;
    explicit file_descriptor(int fd, bool auto_close = true);

    virtual ~file_descriptor();

    file_descriptor(const file_descriptor &) = delete;
    auto operator=(const file_descriptor &) -> file_descriptor & = delete;

    file_descriptor(file_descriptor &&other) noexcept;
    auto operator=(file_descriptor &&other) noexcept -> file_descriptor &;

    [[nodiscard]] auto get() const & noexcept -> int;

    [[nodiscard]] auto get() && noexcept -> int;

    [[nodiscard]] auto valid() const -> bool { return fd_ != -1; }

    auto release() -> void;

    auto duplicate_to(int target, int flags) const -> void;

    // Reads up to size bytes, bytes_read is 0 on Eof and TryAgain.
    auto read_some(void *buf, std::size_t size, std::size_t &bytes_read) const -> IOStatus;

    // Writes the whole buffer, retrying on EINTR and short writes.
    auto write_all(const void *buf, std::size_t size) const -> void;

    template<typename T>
    [[nodiscard]] auto read(T &out) const -> IOStatus
    {
        static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable for raw read");

        std::size_t bytes_read{ 0 };
        return read_some(&out, sizeof(T), bytes_read);
    }

private:
    bool auto_close_{ false };
    int fd_{ -1 };
};

auto pipe(int flags) -> std::pair<file_descriptor, file_descriptor>;

} // namespace ctr_adapter::utils
