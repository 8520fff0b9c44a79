/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>
#include <iterator>

#include <tether/internal/logger.h>
#include <transports/mock_test/backend.h>

namespace tether::mock_test
{
    mock_backend::mock_backend(std::shared_ptr<i_tick_source> ticks)
        : ticks_(std::move(ticks))
    {
    }

    void mock_backend::set_behaviour(const std::string& name, behaviour b)
    {
        behaviours_[name] = std::move(b);
    }

    void mock_backend::set_default_behaviour(behaviour b)
    {
        default_behaviour_ = std::move(b);
    }

    void mock_backend::respond_after(const std::string& name, std::chrono::milliseconds delay, function_response response)
    {
        behaviour b;
        b.type = behaviour::kind::RESPOND;
        b.delay = delay;
        b.response = std::move(response);
        set_behaviour(name, std::move(b));
    }

    void mock_backend::never_respond(const std::string& name)
    {
        behaviour b;
        b.type = behaviour::kind::NEVER;
        set_behaviour(name, std::move(b));
    }

    void mock_backend::fault_after(const std::string& name, std::chrono::milliseconds delay, int error_code, std::string message)
    {
        behaviour b;
        b.type = behaviour::kind::FAULT;
        b.delay = delay;
        b.error_code = error_code;
        b.fault_message = std::move(message);
        set_behaviour(name, std::move(b));
    }

    void mock_backend::clear_history()
    {
        history_.clear();
    }

    std::vector<mock_backend::invocation_record> mock_backend::get_history(const std::string& name) const
    {
        std::vector<invocation_record> ret;
        std::copy_if(history_.begin(),
            history_.end(),
            std::back_inserter(ret),
            [&name](const invocation_record& record) { return record.name == name; });
        return ret;
    }

    uint32_t mock_backend::get_attempts(const std::string& name) const
    {
        auto it = attempts_.find(name);
        return it == attempts_.end() ? 0 : it->second;
    }

    uint32_t mock_backend::get_in_flight(const std::string& name) const
    {
        auto it = in_flight_.find(name);
        return it == in_flight_.end() ? 0 : it->second;
    }

    uint32_t mock_backend::get_max_in_flight(const std::string& name) const
    {
        auto it = max_in_flight_.find(name);
        return it == max_in_flight_.end() ? 0 : it->second;
    }

    // returns false if the caller aborted the wait
    CORO_TASK(bool) mock_backend::wait_for(std::chrono::milliseconds delay, const cancellation_token& token)
    {
        auto deadline = ticks_->now() + delay;
        while (ticks_->now() < deadline)
        {
            if (token.is_cancelled())
                CO_RETURN false;
            CO_AWAIT ticks_->next_tick();
        }
        CO_RETURN !token.is_cancelled();
    }

    void mock_backend::conclude(uint64_t sequence, const std::string& name, call_status status, bool aborted)
    {
        in_flight_[name]--;
        auto it = std::find_if(history_.begin(),
            history_.end(),
            [sequence](const invocation_record& record) { return record.sequence == sequence; });
        // history cleared while the invocation was in flight
        if (it == history_.end())
            return;
        it->ended = ticks_->now();
        it->status = status;
        it->aborted = aborted;
    }

    CORO_TASK(call_outcome)
    mock_backend::invoke(const function_descriptor& descriptor, const function_parameters& parameters, cancellation_token token)
    {
        std::string name = descriptor.name;
        auto it = behaviours_.find(name);
        behaviour b = it == behaviours_.end() ? default_behaviour_ : it->second;

        auto attempt = ++attempts_[name];
        auto in_flight = ++in_flight_[name];
        auto& max_in_flight = max_in_flight_[name];
        max_in_flight = std::max(max_in_flight, in_flight);

        auto sequence = invoke_count_++;
        history_.push_back(invocation_record{sequence, name, parameters, ticks_->now(), std::nullopt, std::nullopt, false});
        TETHER_DEBUG("mock_backend invoking {} attempt {}", name, attempt);

        auto type = b.type;
        if (attempt <= b.hang_attempts)
            type = behaviour::kind::NEVER;
        else if (attempt <= b.hang_attempts + b.cancel_attempts)
            type = behaviour::kind::CANCEL;

        call_outcome outcome;
        if (type == behaviour::kind::NEVER)
        {
            while (!token.is_cancelled())
                CO_AWAIT ticks_->next_tick();
            conclude(sequence, name, call_status::cancelled, true);
            outcome.status = call_status::cancelled;
            outcome.error_code = error::CALL_CANCELLED();
            CO_RETURN outcome;
        }

        if (!CO_AWAIT wait_for(b.delay, token))
        {
            conclude(sequence, name, call_status::cancelled, true);
            outcome.status = call_status::cancelled;
            outcome.error_code = error::CALL_CANCELLED();
            CO_RETURN outcome;
        }

        switch (type)
        {
        case behaviour::kind::FAULT:
            outcome.status = call_status::faulted;
            outcome.error_code = b.error_code;
            outcome.fault_message = b.fault_message;
            break;
        case behaviour::kind::CANCEL:
            outcome.status = call_status::cancelled;
            outcome.error_code = error::CALL_CANCELLED();
            break;
        default:
            outcome.status = call_status::completed;
            outcome.response = b.response;
            break;
        }
        conclude(sequence, name, outcome.status, false);
        CO_RETURN outcome;
    }
}
