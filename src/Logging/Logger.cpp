/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#include "Logger.h"

#include <algorithm>
#include <cctype>

#include "../CoreCommon.h"
#include "ConsoleSink.h"

namespace StagingEngine::Core::Logging {

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal") return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

Logger& Logger::global() {
    static Logger* instance = [] {
        // Leaked on purpose so logging from static destructors stays valid
        auto* logger = new Logger();
        logger->addSink(std::make_shared<ConsoleSink>());
        if (auto env = safeGetEnv("STAGING_LOG_LEVEL")) {
            if (auto level = parseLogLevel(*env)) {
                logger->setLevel(*level);
            }
        }
        return logger;
    }();
    return *instance;
}

void Logger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.push_back(std::move(sink));
}

void Logger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.erase(std::remove(_sinks.begin(), _sinks.end(), sink), _sinks.end());
}

void Logger::clearSinks() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    _sinks.clear();
}

size_t Logger::sinkCount() const {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    return _sinks.size();
}

void Logger::log(LogLevel level, std::string_view category, std::string_view message) {
    if (!isEnabled(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.category = std::string(category);
    entry.message = std::string(message);

    std::lock_guard<std::mutex> lock(_sinkMutex);
    for (auto& sink : _sinks) {
        if (sink->shouldLog(level)) {
            sink->write(entry);
        }
    }
    if (level >= LogLevel::Error) {
        for (auto& sink : _sinks) sink->flush();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(_sinkMutex);
    for (auto& sink : _sinks) sink->flush();
}

} // namespace StagingEngine::Core::Logging
