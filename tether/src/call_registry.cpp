/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <algorithm>

#include <tether/internal/call_registry.h>
#include <tether/internal/logger.h>

namespace tether
{
    bool call_completion::resolve(int error_code, function_response response)
    {
        if (resolved_)
            return false;
        resolved_ = true;
        error_code_ = error_code;
        response_ = std::move(response);
        done_.set();
        return true;
    }

    void call_registry::reset_ids()
    {
        TETHER_ASSERT(envelopes_.empty());
        next_id_ = 0;
    }

    call_envelope& call_registry::add(const function_descriptor& descriptor, function_parameters parameters, spinner_mode mode)
    {
        auto id = ++next_id_;
        auto& envelope = envelopes_[id];
        envelope.id = id;
        envelope.name = descriptor.name;
        envelope.descriptor = descriptor;
        envelope.parameters = std::move(parameters);
        envelope.requested_mode = mode;
        envelope.completion = std::make_shared<call_completion>();
        return envelope;
    }

    call_envelope* call_registry::find(uint64_t id)
    {
        auto it = envelopes_.find(id);
        if (it == envelopes_.end())
            return nullptr;
        return &it->second;
    }

    std::optional<call_envelope> call_registry::take(uint64_t id)
    {
        auto it = envelopes_.find(id);
        if (it == envelopes_.end())
            return std::nullopt;
        auto envelope = std::move(it->second);
        envelopes_.erase(it);
        return envelope;
    }

    bool call_registry::remove(uint64_t id)
    {
        return envelopes_.erase(id) != 0;
    }

    std::vector<uint64_t> call_registry::get_ids() const
    {
        std::vector<uint64_t> ids;
        ids.reserve(envelopes_.size());
        for (const auto& item : envelopes_)
        {
            ids.push_back(item.first);
        }
        return ids;
    }

    std::vector<call_snapshot> call_registry::get_snapshots() const
    {
        std::vector<call_snapshot> snapshots;
        snapshots.reserve(envelopes_.size());
        for (const auto& item : envelopes_)
        {
            const auto& envelope = item.second;
            snapshots.push_back(call_snapshot{
                envelope.id, envelope.name, envelope.descriptor.family, envelope.parameters, envelope.attempts});
        }
        return snapshots;
    }

    std::vector<call_envelope> call_registry::take_all()
    {
        std::vector<call_envelope> envelopes;
        envelopes.reserve(envelopes_.size());
        for (auto& item : envelopes_)
        {
            envelopes.push_back(std::move(item.second));
        }
        envelopes_.clear();
        return envelopes;
    }

    void call_registry::add_handle(std::shared_ptr<cancellation_source> handle)
    {
        cancellation_set_.push_back(std::move(handle));
    }

    bool call_registry::remove_handle(const std::shared_ptr<cancellation_source>& handle)
    {
        auto it = std::find(cancellation_set_.begin(), cancellation_set_.end(), handle);
        if (it == cancellation_set_.end())
            return false;
        cancellation_set_.erase(it);
        return true;
    }

    size_t call_registry::cancel_all_handles()
    {
        // cancelling resumes the aborted attempts, they may touch the set so detach it first
        auto handles = std::move(cancellation_set_);
        cancellation_set_.clear();
        for (auto& handle : handles)
        {
            handle->cancel();
        }
        return handles.size();
    }
}
