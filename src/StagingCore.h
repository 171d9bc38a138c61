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
 * @file StagingCore.h
 * @brief Single header that includes all StagingCore components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// File system
#include "FileSystem/AtomicWriter.h"
#include "FileSystem/FileError.h"
#include "FileSystem/FileProperties.h"
#include "FileSystem/PathResolver.h"
#include "FileSystem/StagingDirectory.h"
