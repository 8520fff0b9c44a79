/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

namespace tether
{
    namespace error
    {
        inline constexpr int OK() { return 0; }
        inline constexpr int MIN() { return 1; }
        // the backend reported an application level failure
        inline constexpr int TRANSPORT_ERROR() { return 1; }
        // the call was aborted before it produced a result
        inline constexpr int CALL_CANCELLED() { return 2; }
        // the response could not be loaded into the requested call type
        inline constexpr int INVALID_DATA() { return 3; }
        // the call was issued through an entry point that does not support it
        inline constexpr int INVALID_USAGE() { return 4; }
        inline constexpr int NOT_INITIALISED() { return 5; }
        inline constexpr int ENGINE_SHUTDOWN() { return 6; }
        inline constexpr int SPAWN_FAILED() { return 7; }
        inline constexpr int MAX() { return 7; }

        const char* to_string(int err);
    }
}
