/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

/**
 * @file FileError.h
 * @brief Error taxonomy and exception types raised by StagingCore file operations
 */
#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace StagingEngine::Core::IO {

/**
 * Public error taxonomy surfaced by file operations.
 * Mapping guidelines:
 * - FileNotFound: path does not exist when required (staged file never written)
 * - AccessDenied: create/rename/chmod/chown denied by OS/permissions
 * - DiskFull: ENOSPC/EDQUOT or equivalent
 * - InvalidPath: malformed path, name too long, wrong file type, or no file name
 * - AlreadyExists: destination present and replacing it was not requested
 * - InvalidArgument: unknown user or group name
 * - IOError: other local I/O failures (including fsync failures)
 */
enum class FileError {
    None = 0,
    FileNotFound,
    AccessDenied,
    DiskFull,
    InvalidPath,
    AlreadyExists,
    InvalidArgument,
    IOError,
    Unknown
};

struct FileErrorInfo {
    FileError code = FileError::None;
    std::string message;
    std::optional<std::error_code> systemError;
    std::string path;
};

std::string_view toString(FileError code) noexcept;

// Map errno to FileError with platform-specific handling
FileError fileErrorFromErrno(int err) noexcept;

/**
 * @brief Exception carrying a FileErrorInfo
 *
 * what() reads "<message>: <path>" followed by the system error text when one is
 * attached, so the offending path is always visible to operators.
 */
class FileSystemError : public std::runtime_error {
public:
    explicit FileSystemError(FileErrorInfo info);
    FileSystemError(FileError code, const std::string& message, const std::string& path = "",
                    std::optional<std::error_code> ec = std::nullopt);

    const FileErrorInfo& info() const noexcept { return _info; }
    FileError code() const noexcept { return _info.code; }
    const std::string& path() const noexcept { return _info.path; }
    const std::optional<std::error_code>& systemError() const noexcept { return _info.systemError; }

private:
    FileErrorInfo _info;
};

/**
 * @brief Raised when publishing without overwrite finds the destination occupied
 *
 * The destination is left exactly as it was.
 */
class DestinationExistsError : public FileSystemError {
public:
    explicit DestinationExistsError(const std::string& destination);
};

/**
 * @brief Builds a FileSystemError from an errno value
 * @param err errno captured immediately after the failing call
 * @param message What was being attempted
 * @param path Path the operation targeted
 */
FileSystemError makeErrnoError(int err, const std::string& message, const std::string& path);

} // namespace StagingEngine::Core::IO
