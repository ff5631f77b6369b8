#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for mvccdb
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>
#include <string_view>

#include "common/config.hpp"

namespace mvccdb {

/**
 * @brief Logger wrapper for mvccdb
 *
 * One process-wide spdlog logger shared by every Database instance. Only
 * lifecycle events are logged; errors travel back to callers as Status.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = config::kDefaultLoggerName,
                     spdlog::level::level_enum level = spdlog::level::info);

    /**
     * @brief Get the logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * @brief Set the log level
     */
    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Set the log level from its name ("debug", "warn", ...)
     *
     * Unknown names leave the level unchanged and return false.
     */
    static bool set_level(std::string_view level_name);

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    /// Caller holds the logger mutex
    static void init_locked(const std::string& name, spdlog::level::level_enum level);

    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(mvccdb::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(mvccdb::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(mvccdb::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(mvccdb::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(mvccdb::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(mvccdb::Logger::get(), __VA_ARGS__)

}  // namespace mvccdb
