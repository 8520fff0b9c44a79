/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/error_codes.h>

namespace tether
{
    namespace error
    {
        const char* to_string(int err)
        {
            switch (err)
            {
            case OK():
                return "OK";
            case TRANSPORT_ERROR():
                return "TRANSPORT_ERROR";
            case CALL_CANCELLED():
                return "CALL_CANCELLED";
            case INVALID_DATA():
                return "INVALID_DATA";
            case INVALID_USAGE():
                return "INVALID_USAGE";
            case NOT_INITIALISED():
                return "NOT_INITIALISED";
            case ENGINE_SHUTDOWN():
                return "ENGINE_SHUTDOWN";
            case SPAWN_FAILED():
                return "SPAWN_FAILED";
            default:
                return "UNKNOWN_ERROR";
            }
        }
    }
}
