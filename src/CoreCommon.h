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
 * @file CoreCommon.h
 * @brief Core common utilities for StagingCore
 *
 * Small environment helpers shared by every StagingCore component.
 */

#include <optional>
#include <string>
#include <cstdlib>

namespace StagingEngine {
namespace Core {
    // Copies the variable into a std::string so callers never hold the raw getenv pointer.
    // Returns std::nullopt if the variable is not set or is empty.
    inline std::optional<std::string> safeGetEnv(const char* name) {
        if (!name) return std::nullopt;
        const char* v = std::getenv(name);
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    }
} // namespace Core
}
