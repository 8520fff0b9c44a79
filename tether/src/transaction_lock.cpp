/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/logger.h>
#include <tether/internal/transaction_lock.h>

namespace tether
{
    transaction_lock::transaction_lock(std::shared_ptr<i_tick_source> ticks)
        : ticks_(std::move(ticks))
    {
    }

    CORO_TASK(void) transaction_lock::acquire(call_family family)
    {
        if (held_[family])
        {
            TETHER_DEBUG("transaction family {} is held, waiting", family.get_val());
            while (held_[family])
            {
                CO_AWAIT ticks_->next_tick();
            }
        }
        held_[family] = true;
    }

    bool transaction_lock::release(call_family family)
    {
        auto it = held_.find(family);
        if (it == held_.end() || !it->second)
            return false;
        it->second = false;
        return true;
    }

    bool transaction_lock::is_held(call_family family) const
    {
        auto it = held_.find(family);
        return it != held_.end() && it->second;
    }

    transaction_guard::transaction_guard(transaction_lock& lock, call_family family)
        : lock_(&lock)
        , family_(family)
    {
    }

    transaction_guard::transaction_guard(transaction_guard&& other) noexcept
        : lock_(other.lock_)
        , family_(other.family_)
    {
        other.lock_ = nullptr;
    }

    transaction_guard& transaction_guard::operator=(transaction_guard&& other) noexcept
    {
        if (this != &other)
        {
            release();
            lock_ = other.lock_;
            family_ = other.family_;
            other.lock_ = nullptr;
        }
        return *this;
    }

    transaction_guard::~transaction_guard()
    {
        release();
    }

    void transaction_guard::release()
    {
        if (lock_)
        {
            lock_->release(family_);
            lock_ = nullptr;
        }
    }
}
