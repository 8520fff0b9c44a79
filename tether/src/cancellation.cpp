/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <tether/internal/cancellation.h>

namespace tether
{
    cancellation_token::cancellation_token(std::shared_ptr<const cancellation_source> source)
        : source_(std::move(source))
    {
    }

    bool cancellation_token::is_cancelled() const
    {
        return source_ && source_->is_cancelled();
    }

    bool cancellation_source::cancel()
    {
        if (cancelled_)
            return false;
        cancelled_ = true;

        // callbacks may resume coroutines that register or remove callbacks, so run them from a local copy
        auto callbacks = std::move(callbacks_);
        callbacks_.clear();
        for (auto& entry : callbacks)
        {
            entry.second();
        }
        return true;
    }

    uint64_t cancellation_source::on_cancel(std::function<void()> callback)
    {
        auto id = ++next_callback_id_;
        if (cancelled_)
        {
            callback();
            return id;
        }
        callbacks_.emplace_back(id, std::move(callback));
        return id;
    }

    void cancellation_source::remove_callback(uint64_t id)
    {
        callbacks_.erase(std::remove_if(callbacks_.begin(),
                             callbacks_.end(),
                             [id](const std::pair<uint64_t, std::function<void()>>& entry) { return entry.first == id; }),
            callbacks_.end());
    }

    cancellation_token cancellation_source::get_token() const
    {
        return cancellation_token(weak_from_this().lock());
    }
}
