/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <memory>
#include <unordered_map>

#include <tether/internal/coroutine_support.h>
#include <tether/internal/tick_source.h>
#include <tether/internal/types.h>

namespace tether
{
    // Per family gate that keeps at most one transaction call of that family executing.
    // Waiters poll once per tick, there is no fairness between waiters of the same family.
    class transaction_lock
    {
        std::shared_ptr<i_tick_source> ticks_;
        std::unordered_map<call_family, bool> held_;

    public:
        explicit transaction_lock(std::shared_ptr<i_tick_source> ticks);

        CORO_TASK(void) acquire(call_family family);
        // returns false if the family was not held
        bool release(call_family family);
        bool is_held(call_family family) const;
    };

    // releases the family when it goes out of scope, whatever the outcome of the call
    class transaction_guard
    {
        transaction_lock* lock_ = nullptr;
        call_family family_;

    public:
        transaction_guard() = default;
        transaction_guard(transaction_lock& lock, call_family family);
        transaction_guard(transaction_guard&& other) noexcept;
        transaction_guard& operator=(transaction_guard&& other) noexcept;
        transaction_guard(const transaction_guard&) = delete;
        transaction_guard& operator=(const transaction_guard&) = delete;
        ~transaction_guard();

        void release();
    };
}
