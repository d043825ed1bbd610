// SPDX-FileCopyrightText: 2025 UnionTech Software Technology Co., Ltd.
//
// SPDX-License-Identifier: LGPL-3.0-or-later

#include "fake_runtime.h"

#include "ctr_adapter/errors.h"
#include "ctr_adapter/resolver.h"

#include "gtest/gtest.h"

using namespace ctr_adapter;

TEST(Resolver, LatestReturnsMostRecentlyCreated)
{
    test::fake_store store;
    store.add("a", "first");
    auto newest = store.add("b", "second");

    auto containers = resolve(store, false, true, {});
    ASSERT_EQ(containers.size(), 1U);
    EXPECT_EQ(containers.front()->id(), newest->id());
}

TEST(Resolver, LatestWinsOverAllAndNames)
{
    test::fake_store store;
    store.add("a", "first");
    store.add("b", "second");

    auto containers = resolve(store, true, true, { "a" });
    ASSERT_EQ(containers.size(), 1U);
    EXPECT_EQ(containers.front()->id(), "b");
}

TEST(Resolver, LatestWithoutContainersFails)
{
    test::fake_store store;

    try {
        (void)resolve(store, false, true, {});
        FAIL() << "expected an error";
    } catch (const error &e) {
        EXPECT_EQ(e.kind(), error_kind::no_such_container);
    }
}

TEST(Resolver, AllKeepsStoreOrder)
{
    test::fake_store store;
    store.add("a", "first");
    store.add("b", "second");
    store.add("c", "third");

    auto containers = resolve(store, true, false, { "ignored" });
    ASSERT_EQ(containers.size(), 3U);
    EXPECT_EQ(containers[0]->id(), "a");
    EXPECT_EQ(containers[1]->id(), "b");
    EXPECT_EQ(containers[2]->id(), "c");
}

TEST(Resolver, NamesResolveInRequestOrder)
{
    test::fake_store store;
    store.add("a", "first");
    store.add("b", "second");

    auto containers = resolve(store, false, false, { "second", "a" });
    ASSERT_EQ(containers.size(), 2U);
    EXPECT_EQ(containers[0]->id(), "b");
    EXPECT_EQ(containers[1]->id(), "a");
}

TEST(Resolver, RepeatedReferencesResolveOnce)
{
    test::fake_store store;
    store.add("a", "first");
    store.add("b", "second");

    auto containers = resolve(store, false, false, { "first", "b", "a", "second" });
    ASSERT_EQ(containers.size(), 2U);
    EXPECT_EQ(containers[0]->id(), "a");
    EXPECT_EQ(containers[1]->id(), "b");
}

TEST(Resolver, OneUnknownNameFailsTheWholeCall)
{
    test::fake_store store;
    store.add("a", "first");

    try {
        (void)resolve(store, false, false, { "a", "missing", "first" });
        FAIL() << "expected an error";
    } catch (const error &e) {
        EXPECT_EQ(e.kind(), error_kind::no_such_container);
        EXPECT_NE(std::string{ e.what() }.find("missing"), std::string::npos);
    }
}

TEST(Resolver, ValidateRequiresExactlyOneMode)
{
    EXPECT_NO_THROW(validate(selection{ true, false, {} }));
    EXPECT_NO_THROW(validate(selection{ false, true, {} }));
    EXPECT_NO_THROW(validate(selection{ false, false, { "a" } }));

    EXPECT_THROW(validate(selection{}), error);
    EXPECT_THROW(validate(selection{ true, true, {} }), error);
    EXPECT_THROW(validate(selection{ true, false, { "a" } }), error);
    EXPECT_THROW(validate(selection{ false, true, { "a" } }), error);
}
