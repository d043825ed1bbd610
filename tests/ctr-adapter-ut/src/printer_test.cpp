// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/impl/json_printer.h"
#include "ctr_adapter/impl/table_printer.h"

#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

#include <sstream>

using namespace ctr_adapter;

namespace {

auto sample() -> std::vector<container_record>
{
    container_record running;
    running.ID = "0123456789abcdef0123";
    running.name = "web";
    running.bundle = "/bundles/web";
    running.state = container_state::running;
    running.PID = 4242;
    running.created = std::chrono::system_clock::time_point{ std::chrono::seconds(60) };

    container_record exited;
    exited.ID = "fedcba9876543210fedc";
    exited.name = "batch-job";
    exited.bundle = "/bundles/job";
    exited.pod = "pod";
    exited.state = container_state::exited;
    exited.exit_code = 2;

    return { running, exited };
}

} // namespace

TEST(Printer, JsonListsEveryContainer)
{
    std::ostringstream out;
    impl::json_printer printer{ out };
    printer.print_containers(sample());

    auto j = nlohmann::json::parse(out.str());
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 2U);

    EXPECT_EQ(j[0]["id"], "0123456789abcdef0123");
    EXPECT_EQ(j[0]["name"], "web");
    EXPECT_EQ(j[0]["status"], "running");
    EXPECT_EQ(j[0]["pid"], 4242);
    EXPECT_EQ(j[0]["created"], "1970-01-01T00:01:00.000000000Z");
    EXPECT_FALSE(j[0].contains("exitCode"));

    EXPECT_EQ(j[1]["status"], "exited");
    EXPECT_EQ(j[1]["exitCode"], 2);
    EXPECT_EQ(j[1]["pod"], "pod");
}

TEST(Printer, TableUsesShortIds)
{
    std::ostringstream out;
    impl::table_printer printer{ out };
    printer.print_containers(sample());

    std::istringstream lines{ out.str() };
    std::string header;
    std::string first;
    std::string second;
    std::getline(lines, header);
    std::getline(lines, first);
    std::getline(lines, second);

    EXPECT_EQ(header.rfind("CONTAINER ID", 0), 0U);
    EXPECT_NE(header.find("STATUS"), std::string::npos);
    EXPECT_EQ(first.rfind("0123456789ab ", 0), 0U);
    EXPECT_NE(first.find("running"), std::string::npos);
    EXPECT_NE(second.find("batch-job"), std::string::npos);
    EXPECT_NE(second.find("exited"), std::string::npos);
}
