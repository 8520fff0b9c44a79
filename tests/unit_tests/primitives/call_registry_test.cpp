/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <tether/internal/call_registry.h>
#include <tether/internal/error_codes.h>

using namespace tether;
using testing::ElementsAre;

namespace
{
    constexpr function_descriptor get_inventory{"get_inventory", call_family{1}, false};
    constexpr function_descriptor buy_item{"buy_item", call_family{2}, true};
}

TEST(call_registry_test, ids_start_at_one_and_ascend)
{
    call_registry registry;
    auto first = registry.add(get_inventory, {}, spinner_mode::invisible).id;
    auto second = registry.add(buy_item, {{"item", "sword"}}, spinner_mode::instant).id;
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_THAT(registry.get_ids(), ElementsAre(1u, 2u));
}

TEST(call_registry_test, reset_ids_restarts_numbering)
{
    call_registry registry;
    registry.add(get_inventory, {}, spinner_mode::invisible);
    registry.take_all();
    registry.reset_ids();
    EXPECT_EQ(registry.add(get_inventory, {}, spinner_mode::invisible).id, 1u);
}

TEST(call_registry_test, envelope_owns_the_function_name)
{
    call_registry registry;
    std::string name = "get_inventory";
    function_descriptor descriptor{name.c_str(), call_family{1}, false};
    auto id = registry.add(descriptor, {}, spinner_mode::invisible).id;

    name.assign("overwritten!");
    EXPECT_EQ(registry.find(id)->name, "get_inventory");
    EXPECT_EQ(registry.get_snapshots()[0].name, "get_inventory");
}

TEST(call_registry_test, take_removes_the_envelope)
{
    call_registry registry;
    auto id = registry.add(buy_item, {{"item", "sword"}}, spinner_mode::after_timeout).id;

    auto taken = registry.take(id);
    ASSERT_TRUE(taken.has_value());
    EXPECT_EQ(taken->parameters.at("item"), "sword");
    EXPECT_TRUE(registry.empty());
    EXPECT_FALSE(registry.take(id).has_value());
    EXPECT_EQ(registry.find(id), nullptr);
}

TEST(call_registry_test, snapshots_expose_call_data)
{
    call_registry registry;
    auto& envelope = registry.add(buy_item, {{"item", "shield"}}, spinner_mode::instant);
    envelope.attempts = 2;

    auto snapshots = registry.get_snapshots();
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].name, "buy_item");
    EXPECT_EQ(snapshots[0].family, call_family{2});
    EXPECT_EQ(snapshots[0].parameters.at("item"), "shield");
    EXPECT_EQ(snapshots[0].attempts, 2u);
}

TEST(call_registry_test, completion_resolves_once)
{
    call_registry registry;
    auto completion = registry.add(get_inventory, {}, spinner_mode::invisible).completion;
    function_response response;
    response.body = "first";
    EXPECT_TRUE(completion->resolve(error::OK(), response));
    EXPECT_FALSE(completion->resolve(error::TRANSPORT_ERROR(), {}));
    EXPECT_TRUE(completion->is_resolved());
    EXPECT_EQ(completion->get_error_code(), error::OK());
    EXPECT_EQ(completion->get_response().body, "first");
}

TEST(call_registry_test, cancel_all_handles_empties_the_set)
{
    call_registry registry;
    auto first = std::make_shared<cancellation_source>();
    auto second = std::make_shared<cancellation_source>();
    registry.add_handle(first);
    registry.add_handle(second);
    EXPECT_EQ(registry.get_handle_count(), 2u);

    EXPECT_EQ(registry.cancel_all_handles(), 2u);
    EXPECT_TRUE(first->is_cancelled());
    EXPECT_TRUE(second->is_cancelled());
    EXPECT_EQ(registry.get_handle_count(), 0u);
}

TEST(call_registry_test, removed_handle_is_not_cancelled)
{
    call_registry registry;
    auto handle = std::make_shared<cancellation_source>();
    registry.add_handle(handle);
    EXPECT_TRUE(registry.remove_handle(handle));
    EXPECT_FALSE(registry.remove_handle(handle));
    registry.cancel_all_handles();
    EXPECT_FALSE(handle->is_cancelled());
}
