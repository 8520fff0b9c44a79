/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include "call_manager_fixture.h"

using namespace tether;

template<class T> class transaction_test : public call_manager_test<T>
{
};

TYPED_TEST_SUITE(transaction_test, call_manager_test_implementations);

namespace
{
    CORO_TASK(void) acquire_and_flag(transaction_lock& lock, call_family family, bool& acquired)
    {
        CO_AWAIT lock.acquire(family);
        acquired = true;
    }
}

// ============================================================================
// TRANSACTION LOCK
// ============================================================================

template<class T> CORO_TASK(bool) coro_lock_blocks_until_release(T& lib)
{
    transaction_lock lock(lib.get_ticks());
    call_family family{10};

    CO_AWAIT lock.acquire(family);
    CORO_ASSERT_TRUE(lock.is_held(family));
    CORO_ASSERT_FALSE(lock.is_held(call_family{11}));

    bool acquired = false;
    CORO_ASSERT_TRUE(lib.get_scheduler()->spawn(acquire_and_flag(lock, family, acquired)));
    CO_AWAIT lib.sleep(100ms);
    CORO_ASSERT_FALSE(acquired);

    CORO_ASSERT_TRUE(lock.release(family));
    CO_AWAIT lib.sleep(30ms);
    CORO_ASSERT_TRUE(acquired);
    CORO_ASSERT_TRUE(lock.is_held(family));

    CORO_ASSERT_TRUE(lock.release(family));
    CORO_ASSERT_FALSE(lock.release(family));
    CO_RETURN true;
}

TYPED_TEST(transaction_test, lock_blocks_until_release)
{
    run_engine_test(*this, [](auto& lib) { return coro_lock_blocks_until_release<TypeParam>(lib); });
}

template<class T> CORO_TASK(bool) coro_guard_releases_on_scope_exit(T& lib)
{
    transaction_lock lock(lib.get_ticks());
    call_family family{3};

    {
        CO_AWAIT lock.acquire(family);
        transaction_guard guard(lock, family);
        transaction_guard moved(std::move(guard));
        CORO_ASSERT_TRUE(lock.is_held(family));
    }
    CORO_ASSERT_FALSE(lock.is_held(family));

    CO_AWAIT lock.acquire(family);
    transaction_guard guard(lock, family);
    guard.release();
    CORO_ASSERT_FALSE(lock.is_held(family));
    CO_RETURN true;
}

TYPED_TEST(transaction_test, guard_releases_on_scope_exit)
{
    run_engine_test(*this, [](auto& lib) { return coro_guard_releases_on_scope_exit<TypeParam>(lib); });
}

// ============================================================================
// SERIALISED CALLS
// ============================================================================

// Two calls of one family issued back to back: the second reaches the backend only after the first completes.
template<class T> CORO_TASK(bool) coro_same_family_calls_serialise(T& lib)
{
    auto backend = lib.get_backend();
    backend->respond_after("buy_item", 500ms);
    backend->respond_after("sell_item", 500ms);
    auto manager = lib.get_manager();

    auto buy = lib.start_call(fixtures::buy_item, {{"item", "sword"}});
    auto sell = lib.start_call(fixtures::sell_item, {{"item", "shield"}});
    CO_AWAIT lib.sleep(100ms);
    CORO_ASSERT_TRUE(manager->is_transaction_held(fixtures::buy_item.family));
    CORO_ASSERT_EQ(backend->get_attempts("sell_item"), 0u);
    CORO_ASSERT_EQ(manager->get_pending_call_count(), 1u);

    CORO_ASSERT_TRUE(CO_AWAIT lib.wait_for(sell, 2s));
    CORO_ASSERT_TRUE(buy->done);
    CORO_ASSERT_EQ(buy->error_code, error::OK());
    CORO_ASSERT_EQ(sell->error_code, error::OK());

    auto buy_history = backend->get_history("buy_item");
    auto sell_history = backend->get_history("sell_item");
    CORO_ASSERT_EQ(buy_history.size(), 1u);
    CORO_ASSERT_EQ(sell_history.size(), 1u);
    CORO_ASSERT_TRUE(buy_history[0].ended.has_value());
    CORO_ASSERT_GE(sell_history[0].started, *buy_history[0].ended);
    CORO_ASSERT_FALSE(manager->is_transaction_held(fixtures::buy_item.family));
    CO_RETURN true;
}

TYPED_TEST(transaction_test, same_family_calls_serialise)
{
    run_engine_test(*this, [](auto& lib) { return coro_same_family_calls_serialise<TypeParam>(lib); });
}

template<class T> CORO_TASK(bool) coro_family_never_executes_concurrently(T& lib)
{
    auto backend = lib.get_backend();
    backend->respond_after("buy_item", 120ms);

    std::vector<std::shared_ptr<test::call_result>> results;
    for (int i = 0; i < 5; i++)
        results.push_back(lib.start_call(fixtures::buy_item, {{"slot", std::to_string(i)}}));

    for (auto& result : results)
    {
        CORO_ASSERT_TRUE(CO_AWAIT lib.wait_for(result, 5s));
        CORO_ASSERT_EQ(result->error_code, error::OK());
    }

    CORO_ASSERT_EQ(backend->get_attempts("buy_item"), 5u);
    CORO_ASSERT_EQ(backend->get_max_in_flight("buy_item"), 1u);

    auto history = backend->get_history("buy_item");
    for (size_t i = 1; i < history.size(); i++)
        CORO_ASSERT_GE(history[i].started, *history[i - 1].ended);
    CO_RETURN true;
}

TYPED_TEST(transaction_test, family_never_executes_concurrently)
{
    run_engine_test(*this, [](auto& lib) { return coro_family_never_executes_concurrently<TypeParam>(lib); });
}

template<class T> CORO_TASK(bool) coro_different_families_run_concurrently(T& lib)
{
    auto backend = lib.get_backend();
    backend->respond_after("buy_item", 500ms);
    backend->respond_after("claim_reward", 500ms);

    auto buy = lib.start_call(fixtures::buy_item);
    auto claim = lib.start_call(fixtures::claim_reward);
    CO_AWAIT lib.sleep(100ms);
    CORO_ASSERT_EQ(backend->get_in_flight("buy_item"), 1u);
    CORO_ASSERT_EQ(backend->get_in_flight("claim_reward"), 1u);

    CORO_ASSERT_TRUE(CO_AWAIT lib.wait_for(buy, 1s));
    CORO_ASSERT_TRUE(CO_AWAIT lib.wait_for(claim, 1s));
    CORO_ASSERT_LE(claim->finished_at, 600ms);
    CO_RETURN true;
}

TYPED_TEST(transaction_test, different_families_run_concurrently)
{
    run_engine_test(*this, [](auto& lib) { return coro_different_families_run_concurrently<TypeParam>(lib); });
}

// The family stays held while a transaction is aborted and replayed.
template<class T> CORO_TASK(bool) coro_lock_held_across_replay(T& lib)
{
    lib.get_settings()->set_spinner_timeout(200ms);
    lib.get_settings()->set_popup_timeout(200ms);
    auto backend = lib.get_backend();
    backend->set_behaviour("buy_item", fixtures::hang_then_respond(1));
    backend->respond_after("sell_item", 50ms);

    auto buy = lib.start_call(fixtures::buy_item);
    auto sell = lib.start_call(fixtures::sell_item);

    CORO_ASSERT_TRUE(CO_AWAIT lib.wait_for(sell, 3s));
    CORO_ASSERT_TRUE(buy->done);
    CORO_ASSERT_EQ(buy->error_code, error::OK());
    CORO_ASSERT_EQ(sell->error_code, error::OK());
    CORO_ASSERT_EQ(backend->get_attempts("buy_item"), 2u);

    auto buy_history = backend->get_history("buy_item");
    auto sell_history = backend->get_history("sell_item");
    CORO_ASSERT_EQ(sell_history.size(), 1u);
    CORO_ASSERT_GE(sell_history[0].started, *buy_history[1].ended);
    CO_RETURN true;
}

TYPED_TEST(transaction_test, lock_held_across_replay)
{
    run_engine_test(*this, [](auto& lib) { return coro_lock_held_across_replay<TypeParam>(lib); });
}

template<class T> CORO_TASK(bool) coro_shutdown_releases_queued_transactions(T& lib)
{
    auto backend = lib.get_backend();
    backend->never_respond("buy_item");
    backend->respond_after("sell_item", 50ms);
    auto manager = lib.get_manager();

    auto buy = lib.start_call(fixtures::buy_item);
    auto sell = lib.start_call(fixtures::sell_item);
    CO_AWAIT lib.sleep(100ms);

    manager->shutdown();
    CORO_ASSERT_TRUE(CO_AWAIT lib.wait_for(buy, 100ms));
    CORO_ASSERT_TRUE(CO_AWAIT lib.wait_for(sell, 100ms));
    CORO_ASSERT_EQ(buy->error_code, error::ENGINE_SHUTDOWN());
    CORO_ASSERT_EQ(sell->error_code, error::ENGINE_SHUTDOWN());
    CORO_ASSERT_EQ(backend->get_attempts("sell_item"), 0u);
    CORO_ASSERT_FALSE(manager->is_transaction_held(fixtures::buy_item.family));
    CO_RETURN true;
}

TYPED_TEST(transaction_test, shutdown_releases_queued_transactions)
{
    run_engine_test(*this, [](auto& lib) { return coro_shutdown_releases_queued_transactions<TypeParam>(lib); });
}
