// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/errors.h"

#include "gtest/gtest.h"

#include <system_error>

using namespace ctr_adapter;

TEST(Errors, KindOfOnlyKnowsOwnErrors)
{
    EXPECT_EQ(kind_of(error(error_kind::io_error, "x")), error_kind::io_error);
    EXPECT_EQ(kind_of(std::runtime_error("x")), std::nullopt);
    EXPECT_TRUE(is(error(error_kind::detached, "x"), error_kind::detached));
    EXPECT_FALSE(is(error(error_kind::detached, "x"), error_kind::not_found));
}

TEST(Errors, DescribeRendersTheMessage)
{
    EXPECT_EQ(describe(std::make_exception_ptr(error(error_kind::not_found, "gone"))), "gone");
    EXPECT_EQ(describe(nullptr), "no error");
    EXPECT_EQ(describe(std::make_exception_ptr(7)), "unknown error");
}

TEST(Errors, ClassifyStartFailure)
{
    EXPECT_EQ(classify_start_failure(error(error_kind::permission_denied, "no")), 126);
    EXPECT_EQ(classify_start_failure(std::system_error(EPERM, std::system_category())), 126);
    EXPECT_EQ(classify_start_failure(std::system_error(EACCES, std::generic_category())), 126);
    EXPECT_EQ(classify_start_failure(std::runtime_error("open x: permission denied")), 126);

    EXPECT_EQ(classify_start_failure(std::system_error(ENOENT, std::system_category())), 127);
    EXPECT_EQ(classify_start_failure(error(error_kind::invalid_state, "running")), 127);
    EXPECT_EQ(classify_start_failure(std::runtime_error("boom")), 127);
}
