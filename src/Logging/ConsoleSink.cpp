/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#include "ConsoleSink.h"

#include <ctime>
#include <iomanip>
#include <iostream>

namespace StagingEngine::Core::Logging {

namespace {
    const char* colorFor(LogLevel level) {
        switch (level) {
            case LogLevel::Trace:   return "\033[90m";
            case LogLevel::Debug:   return "\033[36m";
            case LogLevel::Info:    return "\033[32m";
            case LogLevel::Warning: return "\033[33m";
            case LogLevel::Error:   return "\033[31m";
            case LogLevel::Fatal:   return "\033[1;31m";
            default:                return "";
        }
    }

    void writeTimestamp(std::ostream& os, std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        std::tm local{};
#if defined(_WIN32)
        localtime_s(&local, &t);
#else
        localtime_r(&t, &local);
#endif
        os << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count()
           << std::setfill(' ');
    }
}

ConsoleSink::ConsoleSink(bool useColor)
    : _out(std::cout), _err(std::cerr), _useColor(useColor) {}

ConsoleSink::ConsoleSink(std::ostream& out, std::ostream& err, bool useColor)
    : _out(out), _err(err), _useColor(useColor) {}

void ConsoleSink::write(const LogEntry& entry) {
    if (!shouldLog(entry.level)) return;

    std::ostream& os = entry.level >= LogLevel::Warning ? _err : _out;
    os << '[';
    writeTimestamp(os, entry.timestamp);
    os << "] ";
    if (_useColor) os << colorFor(entry.level);
    os << '[' << toString(entry.level) << ']';
    if (_useColor) os << "\033[0m";
    if (!entry.category.empty()) {
        os << " [" << entry.category << ']';
    }
    os << ' ' << entry.message << '\n';
}

void ConsoleSink::flush() {
    _out.flush();
    _err.flush();
}

} // namespace StagingEngine::Core::Logging
