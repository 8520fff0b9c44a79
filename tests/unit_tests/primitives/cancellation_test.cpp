/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <gtest/gtest.h>
#include <vector>

#include <tether/internal/cancellation.h>

using namespace tether;

TEST(cancellation_test, token_observes_source)
{
    auto source = std::make_shared<cancellation_source>();
    auto token = source->get_token();
    EXPECT_TRUE(token.can_be_cancelled());
    EXPECT_FALSE(token.is_cancelled());

    EXPECT_TRUE(source->cancel());
    EXPECT_TRUE(token.is_cancelled());
}

TEST(cancellation_test, default_token_is_never_cancelled)
{
    cancellation_token token;
    EXPECT_FALSE(token.can_be_cancelled());
    EXPECT_FALSE(token.is_cancelled());
}

TEST(cancellation_test, cancel_is_idempotent)
{
    auto source = std::make_shared<cancellation_source>();
    int calls = 0;
    source->on_cancel([&calls]() { calls++; });

    EXPECT_TRUE(source->cancel());
    EXPECT_FALSE(source->cancel());
    EXPECT_EQ(calls, 1);
}

TEST(cancellation_test, callbacks_run_in_registration_order)
{
    auto source = std::make_shared<cancellation_source>();
    std::vector<int> order;
    source->on_cancel([&order]() { order.push_back(1); });
    source->on_cancel([&order]() { order.push_back(2); });
    source->cancel();
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(cancellation_test, removed_callback_is_not_run)
{
    auto source = std::make_shared<cancellation_source>();
    bool called = false;
    auto id = source->on_cancel([&called]() { called = true; });
    source->remove_callback(id);
    source->cancel();
    EXPECT_FALSE(called);
}

TEST(cancellation_test, late_registration_runs_immediately)
{
    auto source = std::make_shared<cancellation_source>();
    source->cancel();
    bool called = false;
    source->on_cancel([&called]() { called = true; });
    EXPECT_TRUE(called);
}

TEST(cancellation_test, callback_may_register_on_same_source)
{
    auto source = std::make_shared<cancellation_source>();
    int nested = 0;
    source->on_cancel([&]() { source->on_cancel([&nested]() { nested++; }); });
    source->cancel();
    EXPECT_EQ(nested, 1);
}
