/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <tether/internal/logger.h>

#include <spdlog/spdlog.h>

namespace tether
{
    namespace
    {
        std::shared_ptr<spdlog::logger>& logger_slot()
        {
            static std::shared_ptr<spdlog::logger> logger;
            return logger;
        }
    }

    void set_logger(std::shared_ptr<spdlog::logger> logger)
    {
        logger_slot() = std::move(logger);
    }

    std::shared_ptr<spdlog::logger> get_logger()
    {
        auto& logger = logger_slot();
        if (logger)
            return logger;
        return spdlog::default_logger();
    }

    bool parse_log_level(const std::string& name, int& level)
    {
        // spdlog maps unknown names to off
        auto parsed = spdlog::level::from_str(name);
        if (parsed == spdlog::level::off && name != "off")
            return false;
        level = static_cast<int>(parsed);
        return true;
    }

    void log(int level, const std::string& message)
    {
        auto logger = get_logger();
        if (!logger)
            return;
        switch (level)
        {
        case TETHER_LEVEL_TRACE:
            logger->trace(message);
            break;
        case TETHER_LEVEL_DEBUG:
            logger->debug(message);
            break;
        case TETHER_LEVEL_INFO:
            logger->info(message);
            break;
        case TETHER_LEVEL_WARN:
            logger->warn(message);
            break;
        case TETHER_LEVEL_ERROR:
            logger->error(message);
            break;
        case TETHER_LEVEL_CRITICAL:
            logger->critical(message);
            break;
        default:
            logger->info(message);
            break;
        }
    }
}
