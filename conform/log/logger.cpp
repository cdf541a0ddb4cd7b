/*
 * logger.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Shared spdlog logger for the validation library

**************************************************/

#include "logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace conform::log {

namespace {
struct LevelInfo {
    LogLevel level;
    std::string_view name;
    spdlog::level::level_enum native;
};

constexpr std::array<LevelInfo, 7> kLevels = {{
    {LogLevel::TRACE, "TRACE", spdlog::level::trace},
    {LogLevel::DEBUG, "DEBUG", spdlog::level::debug},
    {LogLevel::INFO, "INFO", spdlog::level::info},
    {LogLevel::WARN, "WARN", spdlog::level::warn},
    {LogLevel::ERROR, "ERROR", spdlog::level::err},
    {LogLevel::CRITICAL, "CRITICAL", spdlog::level::critical},
    {LogLevel::OFF, "OFF", spdlog::level::off},
}};

// Spellings accepted besides the canonical names.
constexpr std::array<std::pair<std::string_view, LogLevel>, 10> kAliases = {{
    {"T", LogLevel::TRACE},
    {"D", LogLevel::DEBUG},
    {"I", LogLevel::INFO},
    {"W", LogLevel::WARN},
    {"WARNING", LogLevel::WARN},
    {"E", LogLevel::ERROR},
    {"ERR", LogLevel::ERROR},
    {"C", LogLevel::CRITICAL},
    {"CRIT", LogLevel::CRITICAL},
    {"FATAL", LogLevel::CRITICAL},
}};

auto toSpdlogLevel(LogLevel level) -> spdlog::level::level_enum {
    for (const auto& info : kLevels) {
        if (info.level == level) {
            return info.native;
        }
    }
    return spdlog::level::off;
}

auto fromSpdlogLevel(spdlog::level::level_enum native) -> LogLevel {
    for (const auto& info : kLevels) {
        if (info.native == native) {
            return info.level;
        }
    }
    return LogLevel::UNKNOWN;
}

std::mutex loggerMutex;
}  // namespace

std::string logLevelToString(LogLevel level) {
    for (const auto& info : kLevels) {
        if (info.level == level) {
            return std::string(info.name);
        }
    }
    return "UNKNOWN";
}

LogLevel stringToLogLevel(std::string_view levelStr) {
    std::string level(levelStr);
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    for (const auto& info : kLevels) {
        if (info.name == level) {
            return info.level;
        }
    }
    for (const auto& [alias, aliased] : kAliases) {
        if (alias == level) {
            return aliased;
        }
    }
    return LogLevel::UNKNOWN;
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard lock(loggerMutex);
    const std::string name(kLoggerName);
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    auto logger = spdlog::stdout_color_mt(name);
    logger->set_level(spdlog::level::warn);
    return logger;
}

void setLogLevel(LogLevel level) {
    if (level == LogLevel::UNKNOWN) {
        return;
    }
    getLogger()->set_level(toSpdlogLevel(level));
}

LogLevel getLogLevel() { return fromSpdlogLevel(getLogger()->level()); }

}  // namespace conform::log
