// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/utils/file_describer.h"

#include "ctr_adapter/utils/log.h"

#include <array>
#include <cstring>
#include <system_error>

#include <fcntl.h>

ctr_adapter::utils::file_descriptor_invalid_exception::file_descriptor_invalid_exception(
        const std::string &message)
    : std::runtime_error(message)
{
}

ctr_adapter::utils::file_descriptor_invalid_exception::
        ~file_descriptor_invalid_exception() noexcept = default;

ctr_adapter::utils::file_descriptor::file_descriptor(int fd, bool auto_close)
    : auto_close_(auto_close)
    , fd_(fd)
{
    if (fd < 0) {
        throw file_descriptor_invalid_exception("invalid file descriptor");
    }
}

ctr_adapter::utils::file_descriptor::~file_descriptor()
{
    if (fd_ < 0 || !auto_close_) {
        return;
    }

    if (close(fd_) != 0) {
        CTR_ADAPTER_ERR() << "close " << fd_ << " failed:" << ::strerror(errno);
    }
}

ctr_adapter::utils::file_descriptor::file_descriptor(file_descriptor &&other) noexcept
    : auto_close_(other.auto_close_)
    , fd_(other.fd_)
{
    other.fd_ = -1;
}

auto ctr_adapter::utils::file_descriptor::operator=(file_descriptor &&other) noexcept
        -> ctr_adapter::utils::file_descriptor &
{
    if (this == &other) {
        return *this;
    }

    std::swap(this->fd_, other.fd_);
    std::swap(this->auto_close_, other.auto_close_);
    return *this;
}

auto ctr_adapter::utils::file_descriptor::release() -> void
{
    int tmp = -1;
    std::swap(tmp, fd_);

    if (tmp >= 0 && auto_close_ && ::close(tmp) < 0) {
        auto msg{ "failed to close file descriptor " + std::to_string(tmp) + ": "
                  + ::strerror(errno) };
        throw file_descriptor_invalid_exception(msg);
    }
}

auto ctr_adapter::utils::file_descriptor::get() const & noexcept -> int
{
    return fd_;
}

auto ctr_adapter::utils::file_descriptor::get() && noexcept -> int
{
    return std::exchange(fd_, -1);
}

auto ctr_adapter::utils::file_descriptor::duplicate_to(int target, int flags) const -> void
{
    if (fd_ == -1) {
        throw file_descriptor_invalid_exception("file descriptor is closed");
    }

    if (fd_ == target) {
        // dup3 refuses identical descriptors, only the flags need updating
        if (::fcntl(fd_, F_SETFD, flags & O_CLOEXEC ? FD_CLOEXEC : 0) < 0) {
            throw std::system_error(errno, std::system_category(), "fcntl");
        }
        return;
    }

    if (::dup3(fd_, target, flags) < 0) {
        throw std::system_error(errno,
                                std::system_category(),
                                "dup3 " + std::to_string(fd_) + " to " + std::to_string(target));
    }
}

auto ctr_adapter::utils::file_descriptor::read_some(void *buf,
                                                    std::size_t size,
                                                    std::size_t &bytes_read) const -> IOStatus
{
    bytes_read = 0;
    while (true) {
        auto ret = ::read(fd_, buf, size);
        if (ret > 0) {
            bytes_read = static_cast<std::size_t>(ret);
            return IOStatus::Success;
        }

        if (ret == 0) {
            return IOStatus::Eof;
        }

        if (errno == EINTR) {
            continue;
        }

        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return IOStatus::TryAgain;
        }

        throw std::system_error(errno, std::system_category(), "read " + std::to_string(fd_));
    }
}

auto ctr_adapter::utils::file_descriptor::write_all(const void *buf, std::size_t size) const -> void
{
    const auto *ptr = static_cast<const char *>(buf);
    while (size > 0) {
        auto ret = ::write(fd_, ptr, size);
        if (ret < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }

            throw std::system_error(errno, std::system_category(), "write " + std::to_string(fd_));
        }

        ptr += ret;
        size -= static_cast<std::size_t>(ret);
    }
}

namespace ctr_adapter::utils {

auto pipe(int flags) -> std::pair<file_descriptor, file_descriptor>
{
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), flags) == -1) {
        throw std::system_error(errno,
                                std::system_category(),
                                "pipe2(" + std::to_string(flags) + ")");
    }

    return std::make_pair(file_descriptor(fds[0]), file_descriptor(fds[1]));
}

} // namespace ctr_adapter::utils
