#pragma once

/**
 * @file logger.hpp
 * @brief Logging utilities for csvcols
 *
 * All log output goes to stderr; stdout is reserved for table data.
 */

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <string>
#include <string_view>

#include "csvcols/status.hpp"

namespace csvcols {

/**
 * @brief Logger wrapper for csvcols
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param name Logger name
     * @param level Log level (trace, debug, info, warn, error, critical)
     */
    static void init(const std::string& name = "csvcols",
                     spdlog::level::level_enum level = spdlog::level::warn);

    /**
     * @brief Get the logger instance
     */
    static std::shared_ptr<spdlog::logger>& get();

    /**
     * @brief Set the log level
     */
    static void set_level(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name such as "debug" or "off"
     * @return InvalidArgument for names spdlog does not know
     */
    [[nodiscard]] static Status parse_level(std::string_view name,
                                            spdlog::level::level_enum* level);

    /**
     * @brief Shutdown the logging system
     */
    static void shutdown();

private:
    static std::shared_ptr<spdlog::logger> logger_;
};

// Convenience macros for logging
#define LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(csvcols::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(csvcols::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)     SPDLOG_LOGGER_INFO(csvcols::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)     SPDLOG_LOGGER_WARN(csvcols::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(csvcols::Logger::get(), __VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(csvcols::Logger::get(), __VA_ARGS__)

}  // namespace csvcols
