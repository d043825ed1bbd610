// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "fake_runtime.h"
#include "temp_dir.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/run_orchestrator.h"

#include "gtest/gtest.h"

#include <sstream>
#include <system_error>

using namespace ctr_adapter;

namespace {

constexpr stdio_fds test_fds{ 10, 11, 12 };

auto attached_config() -> run_config
{
    run_config config;
    config.bundle = "/bundle";
    return config;
}

auto detached_config() -> run_config
{
    auto config = attached_config();
    config.detach = true;
    return config;
}

} // namespace

TEST(RunOrchestrator, DetachedPrintsOnlyTheId)
{
    test::fake_store store;
    store.next = store.add("0123456789abcdef", "web");
    store.next->state_ = container_state::configured;

    std::ostringstream out;
    run_orchestrator orchestrator{ store, detached_config(), test_fds, out };

    EXPECT_EQ(orchestrator.run(), 0);
    EXPECT_EQ(out.str(), "0123456789abcdef\n");
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::detached_start);

    auto &container = *store.containers.front();
    EXPECT_EQ(container.start_calls, std::vector<bool>{ false });
    EXPECT_TRUE(container.attach_calls.empty());
    EXPECT_TRUE(container.wait_calls.empty());
}

TEST(RunOrchestrator, DetachedStartCascadesToThePod)
{
    test::fake_store store;
    auto config = detached_config();
    config.pod = "pod";

    std::ostringstream out;
    run_orchestrator orchestrator{ store, config, test_fds, out };

    EXPECT_EQ(orchestrator.run(), 0);
    EXPECT_EQ(store.containers.front()->start_calls, std::vector<bool>{ true });
}

TEST(RunOrchestrator, DetachedStartFailureMapsToShellCodes)
{
    struct failure
    {
        std::exception_ptr error;
        int code;
    };

    const std::vector<failure> failures{
        { std::make_exception_ptr(std::runtime_error("open /bin/app: permission denied")), 126 },
        { std::make_exception_ptr(std::runtime_error("Permission Denied")), 127 },
        { std::make_exception_ptr(error(error_kind::permission_denied, "not allowed")), 126 },
        { std::make_exception_ptr(std::system_error(EACCES, std::system_category(), "exec")),
          126 },
        { std::make_exception_ptr(std::runtime_error("executable file not found")), 127 },
        { std::make_exception_ptr(std::system_error(ENOENT, std::system_category(), "exec")),
          127 },
    };

    for (const auto &f : failures) {
        test::fake_store store;
        store.next = store.add("c1", "");
        store.next->start_error = f.error;

        std::ostringstream out;
        run_orchestrator orchestrator{ store, detached_config(), test_fds, out };

        EXPECT_EQ(orchestrator.run(), f.code) << describe(f.error);
        EXPECT_TRUE(out.str().empty());
    }
}

TEST(RunOrchestrator, CreateFailureIsFatal)
{
    test::fake_store store;
    store.create_error = std::make_exception_ptr(error(error_kind::invalid_argument, "no bundle"));

    run_orchestrator orchestrator{ store, attached_config(), test_fds };
    EXPECT_THROW((void)orchestrator.run(), error);
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::initial);
}

TEST(RunOrchestrator, AttachedReturnsTheContainerExitCode)
{
    test::fake_store store;
    store.next = store.add("c1", "");
    store.next->exit_code = 3;

    run_orchestrator orchestrator{ store, attached_config(), test_fds };

    EXPECT_EQ(orchestrator.run(), 3);
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::retained);
    EXPECT_TRUE(store.removals.empty());
}

TEST(RunOrchestrator, DefaultStreamSelection)
{
    test::fake_store store;
    run_orchestrator orchestrator{ store, attached_config(), test_fds };
    EXPECT_EQ(orchestrator.run(), 0);

    const auto &options = store.containers.front()->attach_calls.at(0);
    EXPECT_EQ(options.input, -1);
    EXPECT_EQ(options.output, 11);
    EXPECT_EQ(options.error, 12);
    EXPECT_EQ(options.detach_keys, "ctrl-p,ctrl-q");
    EXPECT_TRUE(options.sig_proxy);
    EXPECT_FALSE(options.start_dependencies);
}

TEST(RunOrchestrator, InteractiveAttachesStdin)
{
    test::fake_store store;
    auto config = attached_config();
    config.interactive = true;
    config.sig_proxy = false;
    config.detach_keys = "ctrl-x";

    run_orchestrator orchestrator{ store, config, test_fds };
    EXPECT_EQ(orchestrator.run(), 0);

    const auto &options = store.containers.front()->attach_calls.at(0);
    EXPECT_EQ(options.input, 10);
    EXPECT_EQ(options.output, 11);
    EXPECT_EQ(options.error, 12);
    EXPECT_EQ(options.detach_keys, "ctrl-x");
    EXPECT_FALSE(options.sig_proxy);
}

TEST(RunOrchestrator, ExplicitAttachReplacesTheDefaults)
{
    test::fake_store store;
    auto config = attached_config();
    config.attach = std::vector<std::string>{ "stdout" };

    run_orchestrator orchestrator{ store, config, test_fds };
    EXPECT_EQ(orchestrator.run(), 0);

    const auto &options = store.containers.front()->attach_calls.at(0);
    EXPECT_EQ(options.input, -1);
    EXPECT_EQ(options.output, 11);
    EXPECT_EQ(options.error, -1);
}

TEST(RunOrchestrator, SelectStreams)
{
    auto streams = select_streams(false, std::nullopt);
    EXPECT_FALSE(streams.input);
    EXPECT_TRUE(streams.output);
    EXPECT_TRUE(streams.error);

    streams = select_streams(true, std::vector<std::string>{ "STDERR" });
    EXPECT_FALSE(streams.input);
    EXPECT_FALSE(streams.output);
    EXPECT_TRUE(streams.error);

    streams = select_streams(false, std::vector<std::string>{ "stdin", "stdout" });
    EXPECT_TRUE(streams.input);
    EXPECT_TRUE(streams.output);
    EXPECT_FALSE(streams.error);

    streams = select_streams(true, std::vector<std::string>{});
    EXPECT_FALSE(streams.input);
    EXPECT_FALSE(streams.output);
    EXPECT_FALSE(streams.error);
}

TEST(RunOrchestrator, SelectStreamsRejectsNonAsciiNames)
{
    EXPECT_THROW((void)select_streams(false, std::vector<std::string>{ "std\xC3\xB6ut" }), error);
    EXPECT_THROW((void)select_streams(false, std::vector<std::string>{ "\xFF" }), error);
}

TEST(RunOrchestrator, InvalidStreamFailsBeforeCreate)
{
    test::fake_store store;
    auto config = attached_config();
    config.attach = std::vector<std::string>{ "stdout", "stdlog" };

    run_orchestrator orchestrator{ store, config, test_fds };
    try {
        (void)orchestrator.run();
        FAIL() << "expected an error";
    } catch (const error &e) {
        EXPECT_EQ(e.kind(), error_kind::invalid_argument);
    }

    EXPECT_TRUE(store.created_configs.empty());
    EXPECT_TRUE(store.containers.empty());
}

TEST(RunOrchestrator, AttachFailureMapsToShellCodes)
{
    test::fake_store store;
    store.next = store.add("c1", "");
    store.next->attach_error =
            std::make_exception_ptr(std::runtime_error("exec: permission denied"));
    run_orchestrator denied{ store, attached_config(), test_fds };
    EXPECT_EQ(denied.run(), 126);

    store.next = store.add("c2", "");
    store.next->attach_error = std::make_exception_ptr(std::runtime_error("no such file"));
    run_orchestrator missing{ store, attached_config(), test_fds };
    EXPECT_EQ(missing.run(), 127);
    EXPECT_EQ(missing.current_state(), run_orchestrator::state::retained);
}

TEST(RunOrchestrator, AttachFailureWithRmRemovesTheContainer)
{
    test::fake_store store;
    store.next = store.add("c1", "");
    store.next->attach_error = std::make_exception_ptr(std::runtime_error("boom"));
    auto config = attached_config();
    config.remove = true;

    run_orchestrator orchestrator{ store, config, test_fds };
    EXPECT_EQ(orchestrator.run(), 127);
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::removed);

    ASSERT_EQ(store.removals.size(), 1U);
    EXPECT_EQ(store.removals[0].id, "c1");
    EXPECT_TRUE(store.removals[0].force);
    EXPECT_TRUE(store.containers.empty());
}

TEST(RunOrchestrator, RemoveFailureKeepsTheExitCode)
{
    test::fake_store store;
    store.next = store.add("c1", "");
    store.next->attach_error =
            std::make_exception_ptr(error(error_kind::permission_denied, "no access"));
    store.remove_error = std::make_exception_ptr(std::runtime_error("busy"));
    auto config = attached_config();
    config.remove = true;

    run_orchestrator orchestrator{ store, config, test_fds };
    EXPECT_EQ(orchestrator.run(), 126);
    EXPECT_EQ(store.removals.size(), 1U);
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::retained);
}

TEST(RunOrchestrator, UserDetachLeavesTheContainerAlone)
{
    test::fake_store store;
    store.next = store.add("c1", "");
    store.next->attach_error = std::make_exception_ptr(error(error_kind::detached, "detached"));
    auto config = attached_config();
    config.remove = true;

    run_orchestrator orchestrator{ store, config, test_fds };
    EXPECT_EQ(orchestrator.run(), 0);
    EXPECT_TRUE(store.removals.empty());
    EXPECT_TRUE(store.containers.front()->wait_calls.empty());
}

TEST(RunOrchestrator, RecoversExitCodeOfVanishedContainer)
{
    test::temp_dir tmp;
    tmp.write("exits/c1-old", "42\n");

    runtime_config runtime;
    runtime.tmp_dir = tmp.path();
    test::fake_store store{ runtime };
    store.next = store.add("c1", "");
    store.next->wait_error = std::make_exception_ptr(error(error_kind::no_such_container, "gone"));

    run_orchestrator orchestrator{ store, attached_config(), test_fds };
    EXPECT_EQ(orchestrator.run(), 42);
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::retained);
}

TEST(RunOrchestrator, MissingExitRecordYields127)
{
    test::temp_dir tmp;

    runtime_config runtime;
    runtime.tmp_dir = tmp.path();
    test::fake_store store{ runtime };
    store.next = store.add("c1", "");
    store.next->wait_error = std::make_exception_ptr(error(error_kind::no_such_container, "gone"));

    run_orchestrator orchestrator{ store, attached_config(), test_fds };
    EXPECT_EQ(orchestrator.run(), 127);
}

TEST(RunOrchestrator, OtherWaitFailureKeepsTheInitialCode)
{
    test::fake_store store;
    store.next = store.add("c1", "");
    store.next->wait_error = std::make_exception_ptr(std::runtime_error("interrupted"));
    auto config = attached_config();
    config.remove = true;

    run_orchestrator orchestrator{ store, config, test_fds };
    EXPECT_EQ(orchestrator.run(default_run_exit_code), 125);

    ASSERT_EQ(store.removals.size(), 1U);
    EXPECT_FALSE(store.removals[0].force);
    EXPECT_TRUE(store.removals[0].remove_volumes);
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::removed);
}

TEST(RunOrchestrator, CleanupErrorsAreNotSurfaced)
{
    test::fake_store store;
    store.next = store.add("c1", "");
    store.next->exit_code = 9;
    store.remove_error = std::make_exception_ptr(error(error_kind::invalid_state, "running"));
    auto config = attached_config();
    config.remove = true;

    run_orchestrator orchestrator{ store, config, test_fds };
    EXPECT_EQ(orchestrator.run(), 9);
    EXPECT_EQ(orchestrator.current_state(), run_orchestrator::state::retained);
}

TEST(RunOrchestrator, RunsOnlyOnce)
{
    test::fake_store store;
    run_orchestrator orchestrator{ store, attached_config(), test_fds };
    EXPECT_EQ(orchestrator.run(), 0);
    EXPECT_THROW((void)orchestrator.run(), std::logic_error);
}
