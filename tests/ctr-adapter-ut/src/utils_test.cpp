// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "ctr_adapter/errors.h"
#include "ctr_adapter/utils/channel.h"
#include "ctr_adapter/utils/defer.h"
#include "ctr_adapter/utils/detach_keys.h"
#include "ctr_adapter/utils/platform.h"
#include "ctr_adapter/utils/time.h"
#include "ctr_adapter/utils/wait_group.h"

#include "gtest/gtest.h"

#include <atomic>
#include <csignal>
#include <thread>
#include <vector>

using namespace ctr_adapter;

TEST(Channel, DrainsAfterClose)
{
    utils::channel<int> ch(4);
    ch.push(1);
    ch.push(2);
    ch.close();

    EXPECT_TRUE(ch.closed());
    EXPECT_EQ(ch.pop(), 1);
    EXPECT_EQ(ch.pop(), 2);
    EXPECT_EQ(ch.pop(), std::nullopt);
    EXPECT_THROW(ch.push(3), std::logic_error);
}

TEST(Channel, ZeroCapacityHoldsOneValue)
{
    utils::channel<int> ch(0);
    EXPECT_EQ(ch.capacity(), 1U);
}

TEST(Channel, ProducerBlocksWhileFull)
{
    utils::channel<int> ch(1);
    ch.push(1);

    std::atomic<bool> pushed{ false };
    std::thread producer([&ch, &pushed]() {
        ch.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(ch.pop(), 1);

    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(ch.size(), 1U);
}

TEST(Channel, CloseWakesBlockedConsumer)
{
    utils::channel<int> ch(1);
    std::optional<int> got{ 0 };
    std::thread consumer([&ch, &got]() { got = ch.pop(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ch.close();
    consumer.join();
    EXPECT_EQ(got, std::nullopt);
}

TEST(WaitGroup, WaitsForEveryDone)
{
    utils::wait_group group;
    std::atomic<int> finished{ 0 };
    std::vector<std::thread> threads;

    group.add(3);
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&group, &finished]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            ++finished;
            group.done();
        });
    }

    group.wait();
    EXPECT_EQ(finished.load(), 3);
    for (auto &thread : threads) {
        thread.join();
    }

    EXPECT_THROW(group.done(), std::logic_error);
}

TEST(Defer, ErrDeferRunsOnlyWhileUnwinding)
{
    int always{ 0 };
    int on_error{ 0 };

    {
        auto a = utils::make_defer([&always]() noexcept { ++always; });
        auto e = utils::make_errdefer([&on_error]() noexcept { ++on_error; });
    }
    EXPECT_EQ(always, 1);
    EXPECT_EQ(on_error, 0);

    try {
        auto a = utils::make_defer([&always]() noexcept { ++always; });
        auto e = utils::make_errdefer([&on_error]() noexcept { ++on_error; });
        throw std::runtime_error("unwind");
    } catch (const std::runtime_error &) {
    }
    EXPECT_EQ(always, 2);
    EXPECT_EQ(on_error, 1);
}

TEST(DetachKeys, ParsesSequences)
{
    EXPECT_EQ(utils::parse_detach_keys("ctrl-p,ctrl-q"), (std::vector<unsigned char>{ 16, 17 }));
    EXPECT_EQ(utils::parse_detach_keys("CTRL-A,x"), (std::vector<unsigned char>{ 1, 'x' }));
    EXPECT_EQ(utils::parse_detach_keys("ctrl-@,ctrl-["), (std::vector<unsigned char>{ 0, 27 }));
    EXPECT_TRUE(utils::parse_detach_keys("").empty());
}

TEST(DetachKeys, RejectsInvalidSequences)
{
    EXPECT_THROW((void)utils::parse_detach_keys("ctrl-"), error);
    EXPECT_THROW((void)utils::parse_detach_keys("ctrl-1"), error);
    EXPECT_THROW((void)utils::parse_detach_keys("alt-p"), error);
    EXPECT_THROW((void)utils::parse_detach_keys("ctrl-p,"), error);
}

TEST(DetachKeys, MatcherHoldsBackPrefix)
{
    utils::detach_matcher matcher{ utils::parse_detach_keys("ctrl-p,ctrl-q") };

    std::string forward;
    EXPECT_FALSE(matcher.feed("ab\x10", 3, forward));
    EXPECT_EQ(forward, "ab");

    // a byte that breaks the sequence releases what was held back
    EXPECT_FALSE(matcher.feed("c", 1, forward));
    EXPECT_EQ(forward, "ab\x10" "c");

    forward.clear();
    EXPECT_FALSE(matcher.feed("\x10", 1, forward));
    EXPECT_TRUE(matcher.feed("\x11", 1, forward));
    EXPECT_TRUE(forward.empty());

    // the matcher starts over after a detach
    EXPECT_FALSE(matcher.feed("\x11", 1, forward));
    EXPECT_EQ(forward, "\x11");
}

TEST(DetachKeys, RepeatedFirstKeyStillMatches)
{
    utils::detach_matcher matcher{ utils::parse_detach_keys("ctrl-p,ctrl-q") };

    std::string forward;
    EXPECT_TRUE(matcher.feed("\x10\x10\x11", 3, forward));
    EXPECT_EQ(forward, "\x10");
}

TEST(DetachKeys, EmptySequenceNeverDetaches)
{
    utils::detach_matcher matcher{ {} };

    std::string forward;
    EXPECT_FALSE(matcher.feed("\x10\x11", 2, forward));
    EXPECT_EQ(forward, "\x10\x11");
}

TEST(Signal, ParsesNamesAndNumbers)
{
    EXPECT_EQ(utils::parse_signal("KILL"), SIGKILL);
    EXPECT_EQ(utils::parse_signal("SIGTERM"), SIGTERM);
    EXPECT_EQ(utils::parse_signal("hup"), SIGHUP);
    EXPECT_EQ(utils::parse_signal("9"), 9);
    EXPECT_EQ(utils::str_to_signal("SIGUSR1"), SIGUSR1);
}

TEST(Signal, RejectsUnknownSignals)
{
    EXPECT_THROW((void)utils::parse_signal(""), error);
    EXPECT_THROW((void)utils::parse_signal("0"), error);
    EXPECT_THROW((void)utils::parse_signal("SIGNOPE"), error);
    EXPECT_THROW((void)utils::str_to_signal("KILL"), error);
}

TEST(Time, FormatsAndParsesNanoseconds)
{
    const std::chrono::system_clock::time_point tp{ std::chrono::duration_cast<
            std::chrono::system_clock::duration>(std::chrono::seconds(86400)
                                                 + std::chrono::nanoseconds(5000)) };

    EXPECT_EQ(utils::format_rfc3339_nano(tp), "1970-01-02T00:00:00.000005000Z");
    EXPECT_EQ(utils::parse_rfc3339_nano("1970-01-02T00:00:00.000005Z"), tp);
    EXPECT_THROW((void)utils::parse_rfc3339_nano("1970-01-02T00:00:00+01:00"), error);
}
