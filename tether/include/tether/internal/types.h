/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace tether
{
    // Ordered by priority: a later entry overrides an earlier one when several calls are in flight
    enum class spinner_mode : uint8_t
    {
        invisible,
        after_timeout,
        instant
    };

    enum class manager_state : uint8_t
    {
        idle,
        processing,
        timed_out,
        error
    };

    enum class timeout_phase : uint8_t
    {
        to_spinner,
        to_popup
    };

    enum class connectivity_state : uint8_t
    {
        reachable,
        degraded,   // network is up but the server cannot be reached
        unreachable // no network at all
    };

    enum class call_status : uint8_t
    {
        completed,
        faulted,
        cancelled
    };

    const char* to_string(spinner_mode mode);
    const char* to_string(manager_state state);
    const char* to_string(timeout_phase phase);
    const char* to_string(connectivity_state state);
    const char* to_string(call_status status);

    // identifies a logical category of remote function, transaction serialisation is per family
    class call_family
    {
        uint64_t val_ = 0;

    public:
        constexpr call_family() = default;
        constexpr explicit call_family(uint64_t val)
            : val_(val)
        {
        }

        constexpr uint64_t get_val() const { return val_; }

        constexpr bool operator==(const call_family& other) const { return val_ == other.val_; }
        constexpr bool operator!=(const call_family& other) const { return val_ != other.val_; }
        constexpr bool operator<(const call_family& other) const { return val_ < other.val_; }
    };

    // static description of a remote function type
    struct function_descriptor
    {
        const char* name = "";
        call_family family;
        bool transaction = false;
    };

    using function_parameters = std::map<std::string, std::string>;

    // what the backend sent back, only user_data and resources are interpreted by the engine
    struct function_response
    {
        std::string body;
        std::string user_data;
        std::string resources;
    };

    struct call_outcome
    {
        call_status status = call_status::cancelled;
        int error_code = 0;
        std::string fault_message;
        function_response response;
    };
}

namespace std
{
    template<> struct hash<tether::call_family>
    {
        auto operator()(const tether::call_family& item) const noexcept { return std::hash<uint64_t>()(item.get_val()); }
    };
}
