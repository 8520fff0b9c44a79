/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <tether/internal/cancellation.h>
#include <tether/internal/event.h>
#include <tether/internal/types.h>

namespace tether
{
    // The slot a suspended caller waits on, it is resolved exactly once
    class call_completion
    {
        bool resolved_ = false;
        int error_code_ = 0;
        function_response response_;
        event done_;

    public:
        // returns false if the completion had already been resolved
        bool resolve(int error_code, function_response response);
        bool is_resolved() const { return resolved_; }

        int get_error_code() const { return error_code_; }
        function_response& get_response() { return response_; }

        CORO_TASK(void) wait() const { CO_AWAIT done_.wait(); }
    };

    /**
     * @brief Retryable record of one logical in-flight call
     *
     * Holds everything needed to replay the call: the static description, the original parameters
     * and the completion slot of the caller. Retries reuse the envelope, only the attempt count changes.
     * The envelope owns a copy of the function name, descriptor.name is only valid while the original caller is.
     */
    struct call_envelope
    {
        uint64_t id = 0;
        std::string name;
        function_descriptor descriptor;
        function_parameters parameters;
        spinner_mode requested_mode = spinner_mode::invisible;
        uint32_t attempts = 0;
        std::shared_ptr<call_completion> completion;
    };

    // introspection copy of an envelope
    struct call_snapshot
    {
        uint64_t id = 0;
        std::string name;
        call_family family;
        function_parameters parameters;
        uint32_t attempts = 0;
    };

    /**
     * @brief Tracks every in-flight resilient call and every live cancellation handle
     *
     * Envelopes are keyed by a monotonically increasing id starting at 1, enumeration is in ascending id order so that
     * recovery replays calls first-registered-first-retried.
     * The cancellation set only holds handles of resilient call attempts, fire-and-forget calls never appear here.
     */
    class call_registry
    {
        uint64_t next_id_ = 0;
        std::map<uint64_t, call_envelope> envelopes_;
        std::vector<std::shared_ptr<cancellation_source>> cancellation_set_;

    public:
        call_registry() = default;
        call_registry(const call_registry&) = delete;
        call_registry& operator=(const call_registry&) = delete;

        // restarts the id sequence, only valid while empty
        void reset_ids();

        call_envelope& add(const function_descriptor& descriptor, function_parameters parameters, spinner_mode mode);
        call_envelope* find(uint64_t id);
        // removes and returns the envelope
        std::optional<call_envelope> take(uint64_t id);
        bool remove(uint64_t id);

        bool empty() const { return envelopes_.empty(); }
        size_t size() const { return envelopes_.size(); }
        std::vector<uint64_t> get_ids() const;
        std::vector<call_snapshot> get_snapshots() const;

        // removes every envelope and hands them back to the caller
        std::vector<call_envelope> take_all();

        void add_handle(std::shared_ptr<cancellation_source> handle);
        bool remove_handle(const std::shared_ptr<cancellation_source>& handle);
        size_t get_handle_count() const { return cancellation_set_.size(); }

        // cancels every live handle and empties the set, returns how many handles were cancelled
        size_t cancel_all_handles();
        void clear_handles() { cancellation_set_.clear(); }
    };
}
