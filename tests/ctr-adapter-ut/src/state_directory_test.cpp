// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "temp_dir.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/impl/state_directory.h"

#include "gtest/gtest.h"

#include <unistd.h>

using namespace ctr_adapter;

namespace {

auto make_record(const std::string &id) -> container_record
{
    container_record record;
    record.ID = id;
    record.name = "name-" + id;
    record.bundle = "/bundles/" + id;
    record.created = std::chrono::system_clock::time_point{ std::chrono::seconds(1700000000) };
    record.log_path = "/logs/" + id + ".log";
    return record;
}

} // namespace

TEST(StateDirectory, WritesAndReadsRecords)
{
    test::temp_dir tmp;
    impl::state_directory states{ tmp.path() };

    auto record = make_record("abc");
    record.pod = "pod";
    record.dependencies = { "x", "y" };
    record.stop_timeout = 3;
    record.stop_signal = SIGINT;
    record.state = container_state::exited;
    record.exit_code = 42;
    states.write(record);

    EXPECT_TRUE(std::filesystem::exists(tmp.path() / "containers" / "abc.json"));

    auto read = states.read("abc");
    EXPECT_EQ(read.ID, "abc");
    EXPECT_EQ(read.name, "name-abc");
    EXPECT_EQ(read.pod, std::optional<std::string>{ "pod" });
    EXPECT_EQ(read.dependencies, (std::vector<std::string>{ "x", "y" }));
    EXPECT_EQ(read.created, record.created);
    EXPECT_EQ(read.stop_timeout, 3U);
    EXPECT_EQ(read.stop_signal, SIGINT);
    EXPECT_EQ(read.state, container_state::exited);
    EXPECT_EQ(read.exit_code, std::optional<int>{ 42 });
}

TEST(StateDirectory, MissingRecordIsNoSuchContainer)
{
    test::temp_dir tmp;
    impl::state_directory states{ tmp.path() };

    try {
        (void)states.read("nope");
        FAIL() << "expected an error";
    } catch (const error &e) {
        EXPECT_EQ(e.kind(), error_kind::no_such_container);
    }

    EXPECT_THROW(states.remove("nope"), error);
}

TEST(StateDirectory, RunningRecordWithoutMonitorReadsExited)
{
    test::temp_dir tmp;
    impl::state_directory states{ tmp.path() };

    auto orphan = make_record("orphan");
    orphan.state = container_state::running;
    orphan.monitor_PID = -1;
    states.write(orphan);

    auto alive = make_record("alive");
    alive.state = container_state::running;
    alive.monitor_PID = ::getpid();
    states.write(alive);

    EXPECT_EQ(states.read("orphan").state, container_state::exited);
    EXPECT_EQ(states.read("alive").state, container_state::running);
}

TEST(StateDirectory, ListSkipsBrokenFiles)
{
    test::temp_dir tmp;
    impl::state_directory states{ tmp.path() };
    states.write(make_record("a"));
    states.write(make_record("b"));
    tmp.write("containers/broken.json", "{");
    tmp.write("containers/notes.txt", "ignored");

    auto records = states.list();
    EXPECT_EQ(records.size(), 2U);

    states.remove("a");
    records = states.list();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records.front().ID, "b");
}

TEST(StateDirectory, CorruptRecordIsAParseError)
{
    test::temp_dir tmp;
    impl::state_directory states{ tmp.path() };
    tmp.write("containers/bad.json", R"({"id": "bad"})");

    try {
        (void)states.read("bad");
        FAIL() << "expected an error";
    } catch (const error &e) {
        EXPECT_EQ(e.kind(), error_kind::parse_error);
    }
}
