/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#pragma once

#include <atomic>

#include "LogEntry.h"

namespace StagingEngine::Core::Logging {

/**
 * @brief Destination for log entries
 *
 * Sinks are shared with the Logger and may be called from any thread; the Logger
 * serializes calls to write() and flush(), so implementations need no locking of
 * their own unless they are also used outside the Logger.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;

    // Entries below this level are skipped for this sink only
    void setMinLevel(LogLevel level) noexcept { _minLevel.store(level, std::memory_order_relaxed); }
    LogLevel getMinLevel() const noexcept { return _minLevel.load(std::memory_order_relaxed); }

    bool shouldLog(LogLevel level) const noexcept {
        return level != LogLevel::Off && level >= getMinLevel();
    }

private:
    std::atomic<LogLevel> _minLevel{LogLevel::Trace};
};

} // namespace StagingEngine::Core::Logging
