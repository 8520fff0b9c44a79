/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace tether
{
    class cancellation_source;

    // read-only view of a cancellation_source handed to the backend transport
    class cancellation_token
    {
        std::shared_ptr<const cancellation_source> source_;

    public:
        cancellation_token() = default;
        explicit cancellation_token(std::shared_ptr<const cancellation_source> source);

        bool is_cancelled() const;
        bool can_be_cancelled() const { return source_ != nullptr; }
    };

    /**
     * @brief Cooperative cancellation handle for one remote call attempt or one escalation cycle
     *
     * Cancelling is idempotent. Callbacks registered before cancellation run synchronously inside cancel(),
     * callbacks registered afterwards run immediately.
     */
    class cancellation_source : public std::enable_shared_from_this<cancellation_source>
    {
        bool cancelled_ = false;
        uint64_t next_callback_id_ = 0;
        std::vector<std::pair<uint64_t, std::function<void()>>> callbacks_;

    public:
        cancellation_source() = default;
        cancellation_source(const cancellation_source&) = delete;
        cancellation_source& operator=(const cancellation_source&) = delete;

        // returns false if the source had already been cancelled
        bool cancel();
        bool is_cancelled() const { return cancelled_; }

        // returns an id that can be passed to remove_callback
        uint64_t on_cancel(std::function<void()> callback);
        void remove_callback(uint64_t id);

        cancellation_token get_token() const;
    };
}
