// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "temp_dir.h"

#include "ctr_adapter/config.h"
#include "ctr_adapter/errors.h"

#include "gtest/gtest.h"

#include <cstdlib>

using namespace ctr_adapter;

TEST(Config, DefaultsWithoutFile)
{
    auto config = load_config(std::nullopt, config_overrides{});

    EXPECT_EQ(config.root, default_root());
    EXPECT_EQ(config.tmp_dir, default_root() / "tmp");
    EXPECT_EQ(config.oci_runtime, "ll-box");
    EXPECT_EQ(config.stop_timeout, 10U);
    EXPECT_EQ(config.wait_interval, std::chrono::milliseconds(250));
}

TEST(Config, DefaultRootFollowsXdgRuntimeDir)
{
    const char *saved = ::getenv("XDG_RUNTIME_DIR");
    const std::string previous = saved == nullptr ? "" : saved;

    ::setenv("XDG_RUNTIME_DIR", "/run/user/4242", 1);
    EXPECT_EQ(default_root(), "/run/user/4242/ctr-adapter");

    if (saved == nullptr) {
        ::unsetenv("XDG_RUNTIME_DIR");
    } else {
        ::setenv("XDG_RUNTIME_DIR", previous.c_str(), 1);
    }
}

TEST(Config, FileValuesAndOverrides)
{
    test::temp_dir tmp;
    tmp.write("config.json",
              R"({"root": "/srv/ctr", "ociRuntime": "crun", "stopTimeout": 3,)"
              R"( "waitInterval": 50})");

    auto config = load_config(tmp.path() / "config.json", config_overrides{});
    EXPECT_EQ(config.root, "/srv/ctr");
    EXPECT_EQ(config.tmp_dir, "/srv/ctr/tmp");
    EXPECT_EQ(config.oci_runtime, "crun");
    EXPECT_EQ(config.stop_timeout, 3U);
    EXPECT_EQ(config.wait_interval, std::chrono::milliseconds(50));

    config_overrides overrides;
    overrides.root = "/other";
    overrides.tmp_dir = "/tmp/x";
    overrides.oci_runtime = "runc";
    config = load_config(tmp.path() / "config.json", overrides);
    EXPECT_EQ(config.root, "/other");
    EXPECT_EQ(config.tmp_dir, "/tmp/x");
    EXPECT_EQ(config.oci_runtime, "runc");
    EXPECT_EQ(config.stop_timeout, 3U);
}

TEST(Config, BadFilesAreReported)
{
    test::temp_dir tmp;
    tmp.write("broken.json", "{ not json");
    tmp.write("array.json", "[1, 2]");
    tmp.write("types.json", R"({"stopTimeout": "soon"})");

    auto kind = [&tmp](const char *name) {
        try {
            (void)load_config(tmp.path() / name, config_overrides{});
        } catch (const error &e) {
            return e.kind();
        }
        ADD_FAILURE() << name << " was accepted";
        return error_kind::invalid_argument;
    };

    EXPECT_EQ(kind("missing.json"), error_kind::io_error);
    EXPECT_EQ(kind("broken.json"), error_kind::parse_error);
    EXPECT_EQ(kind("array.json"), error_kind::parse_error);
    EXPECT_EQ(kind("types.json"), error_kind::parse_error);
}
