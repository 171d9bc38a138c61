/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace StagingEngine::Core::Logging {

/**
 * @brief Severity of a log entry, ordered from most to least verbose
 *
 * Off is only meaningful as a threshold; entries are never logged at Off.
 */
enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warning = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/**
 * @brief Upper-case name of a level ("TRACE", "WARN", ...)
 */
constexpr std::string_view toString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:   return "TRACE";
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Fatal:   return "FATAL";
        case LogLevel::Off:     return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Parses a level name, case-insensitively
 *
 * Accepts the names produced by toString() plus "warning".
 * @return The level, or std::nullopt if the text names no level
 */
std::optional<LogLevel> parseLogLevel(std::string_view text);

} // namespace StagingEngine::Core::Logging
