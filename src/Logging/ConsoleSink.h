/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#pragma once

#include <ostream>

#include "ILogSink.h"

namespace StagingEngine::Core::Logging {

/**
 * @brief Writes entries as single lines to the standard streams
 *
 * Format: `[HH:MM:SS.mmm] [LEVEL] [category] message`. Warning and above go to
 * std::cerr, everything else to std::cout. Tests may redirect both to one stream.
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool useColor = false);
    ConsoleSink(std::ostream& out, std::ostream& err, bool useColor = false);

    void write(const LogEntry& entry) override;
    void flush() override;

    void setUseColor(bool useColor) noexcept { _useColor = useColor; }

private:
    std::ostream& _out;
    std::ostream& _err;
    bool _useColor;
};

} // namespace StagingEngine::Core::Logging
