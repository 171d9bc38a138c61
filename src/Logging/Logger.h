/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#pragma once

/**
 * @file Logger.h
 * @brief Process-wide logger with pluggable sinks
 *
 * Logger::global() is created on first use with a ConsoleSink attached. Its
 * initial threshold comes from the STAGING_LOG_LEVEL environment variable
 * (trace, debug, info, warn, error, fatal, off) and defaults to Info.
 *
 * @code
 * STAGING_LOG_INFO("Published " + destination.string());
 * STAGING_LOG_DEBUG_CAT("AtomicWriter", "Created staging directory");
 * @endcode
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "ILogSink.h"
#include "LogEntry.h"
#include "LogLevel.h"

namespace StagingEngine::Core::Logging {

class Logger {
public:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& global();

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();
    size_t sinkCount() const;

    void setLevel(LogLevel level) noexcept { _level.store(level, std::memory_order_relaxed); }
    LogLevel getLevel() const noexcept { return _level.load(std::memory_order_relaxed); }
    bool isEnabled(LogLevel level) const noexcept {
        return level != LogLevel::Off && level >= getLevel();
    }

    void log(LogLevel level, std::string_view category, std::string_view message);
    void flush();

private:
    std::atomic<LogLevel> _level{LogLevel::Info};
    mutable std::mutex _sinkMutex;
    std::vector<std::shared_ptr<ILogSink>> _sinks;
};

} // namespace StagingEngine::Core::Logging

#define STAGING_LOG_CAT(level, cat, msg)                                                  \
    do {                                                                                  \
        auto& _stagingLogger = ::StagingEngine::Core::Logging::Logger::global();          \
        if (_stagingLogger.isEnabled(level)) _stagingLogger.log((level), (cat), (msg));   \
    } while (0)

#define STAGING_LOG_TRACE_CAT(cat, msg) STAGING_LOG_CAT(::StagingEngine::Core::Logging::LogLevel::Trace, cat, msg)
#define STAGING_LOG_DEBUG_CAT(cat, msg) STAGING_LOG_CAT(::StagingEngine::Core::Logging::LogLevel::Debug, cat, msg)
#define STAGING_LOG_INFO_CAT(cat, msg) STAGING_LOG_CAT(::StagingEngine::Core::Logging::LogLevel::Info, cat, msg)
#define STAGING_LOG_WARNING_CAT(cat, msg) STAGING_LOG_CAT(::StagingEngine::Core::Logging::LogLevel::Warning, cat, msg)
#define STAGING_LOG_ERROR_CAT(cat, msg) STAGING_LOG_CAT(::StagingEngine::Core::Logging::LogLevel::Error, cat, msg)
#define STAGING_LOG_FATAL_CAT(cat, msg) STAGING_LOG_CAT(::StagingEngine::Core::Logging::LogLevel::Fatal, cat, msg)

#define STAGING_LOG_TRACE(msg) STAGING_LOG_TRACE_CAT(__func__, msg)
#define STAGING_LOG_DEBUG(msg) STAGING_LOG_DEBUG_CAT(__func__, msg)
#define STAGING_LOG_INFO(msg) STAGING_LOG_INFO_CAT(__func__, msg)
#define STAGING_LOG_WARNING(msg) STAGING_LOG_WARNING_CAT(__func__, msg)
#define STAGING_LOG_ERROR(msg) STAGING_LOG_ERROR_CAT(__func__, msg)
#define STAGING_LOG_FATAL(msg) STAGING_LOG_FATAL_CAT(__func__, msg)
