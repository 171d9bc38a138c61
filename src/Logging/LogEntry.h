/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "LogLevel.h"

namespace StagingEngine::Core::Logging {

// A single formatted record handed to every sink
struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::string category;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::thread::id threadId = std::this_thread::get_id();
};

} // namespace StagingEngine::Core::Logging
