/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include <fmt/format.h>

namespace spdlog
{
    class logger;
}

// matches the spdlog level numbering
#define TETHER_LEVEL_TRACE 0
#define TETHER_LEVEL_DEBUG 1
#define TETHER_LEVEL_INFO 2
#define TETHER_LEVEL_WARN 3
#define TETHER_LEVEL_ERROR 4
#define TETHER_LEVEL_CRITICAL 5
#define TETHER_LEVEL_OFF 6

namespace tether
{
    // forwards an already formatted message to the active spdlog logger
    void log(int level, const std::string& message);

    // replaces the logger used by the engine, a null pointer restores spdlog's default logger
    void set_logger(std::shared_ptr<spdlog::logger> logger);
    std::shared_ptr<spdlog::logger> get_logger();

    // maps an spdlog level name ("trace" ... "critical", "off") to its TETHER_LEVEL value, false for unknown names
    bool parse_log_level(const std::string& name, int& level);
}

#define TETHER_TRACE(...) ::tether::log(TETHER_LEVEL_TRACE, fmt::format(__VA_ARGS__))
#define TETHER_DEBUG(...) ::tether::log(TETHER_LEVEL_DEBUG, fmt::format(__VA_ARGS__))
#define TETHER_INFO(...) ::tether::log(TETHER_LEVEL_INFO, fmt::format(__VA_ARGS__))
#define TETHER_WARNING(...) ::tether::log(TETHER_LEVEL_WARN, fmt::format(__VA_ARGS__))
#define TETHER_ERROR(...) ::tether::log(TETHER_LEVEL_ERROR, fmt::format(__VA_ARGS__))
#define TETHER_CRITICAL(...) ::tether::log(TETHER_LEVEL_CRITICAL, fmt::format(__VA_ARGS__))

#ifdef NDEBUG
#define TETHER_ASSERT(x)                                                                                               \
    do                                                                                                                 \
    {                                                                                                                  \
    } while (0)
#else
#define TETHER_ASSERT(x)                                                                                               \
    do                                                                                                                 \
    {                                                                                                                  \
        if (!(x))                                                                                                      \
        {                                                                                                              \
            TETHER_CRITICAL("assertion failed: {} ({}:{})", #x, __FILE__, __LINE__);                                   \
            std::abort();                                                                                              \
        }                                                                                                              \
    } while (0)
#endif
