/*
 * logger.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Shared spdlog logger for the validation library

**************************************************/

#ifndef CONFORM_LOG_LOGGER_HPP
#define CONFORM_LOG_LOGGER_HPP

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace conform::log {

/**
 * @brief Enum representing different log levels.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5,
    OFF = 6,
    UNKNOWN = 7
};

/**
 * @brief Name under which the library logger is registered with spdlog.
 */
inline constexpr std::string_view kLoggerName = "conform";

/**
 * @brief Convert log level to string.
 */
std::string logLevelToString(LogLevel level);

/**
 * @brief Convert string to log level. Case-insensitive; accepts the usual
 * abbreviations ("W", "ERR", "FATAL"...). Returns UNKNOWN otherwise.
 */
LogLevel stringToLogLevel(std::string_view levelStr);

/**
 * @brief Returns the library logger.
 *
 * A logger already registered under kLoggerName (by the host application)
 * is reused; otherwise a colored stdout logger is created on first use,
 * starting at WARN.
 */
std::shared_ptr<spdlog::logger> getLogger();

/**
 * @brief Sets the level of the library logger.
 * @param level UNKNOWN is ignored.
 */
void setLogLevel(LogLevel level);

/**
 * @brief Current level of the library logger.
 */
LogLevel getLogLevel();

}  // namespace conform::log

#endif  // CONFORM_LOG_LOGGER_HPP
