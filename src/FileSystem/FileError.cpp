/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#include "FileError.h"

#include <cerrno>

namespace StagingEngine::Core::IO {

namespace {
    std::string describe(const FileErrorInfo& info) {
        std::string text = info.message;
        if (!info.path.empty()) {
            text += ": " + info.path;
        }
        if (info.systemError) {
            text += " (" + info.systemError->message() + ")";
        }
        return text;
    }
}

std::string_view toString(FileError code) noexcept {
    switch (code) {
        case FileError::None:            return "None";
        case FileError::FileNotFound:    return "FileNotFound";
        case FileError::AccessDenied:    return "AccessDenied";
        case FileError::DiskFull:        return "DiskFull";
        case FileError::InvalidPath:     return "InvalidPath";
        case FileError::AlreadyExists:   return "AlreadyExists";
        case FileError::InvalidArgument: return "InvalidArgument";
        case FileError::IOError:         return "IOError";
        case FileError::Unknown:         return "Unknown";
    }
    return "Unknown";
}

FileError fileErrorFromErrno(int err) noexcept {
    switch (err) {
        case ENOSPC:
#if defined(__unix__) || defined(__APPLE__)
        case EDQUOT:  // Disk quota exceeded (POSIX)
#endif
            return FileError::DiskFull;
        case EACCES:
        case EPERM:
            return FileError::AccessDenied;
        case ENOENT:
            return FileError::FileNotFound;
        case EINVAL:
        case ENAMETOOLONG:
        case EISDIR:
        case ENOTDIR:
            return FileError::InvalidPath;
        case EEXIST:
            return FileError::AlreadyExists;
        default:
            return FileError::IOError;
    }
}

FileSystemError::FileSystemError(FileErrorInfo info)
    : std::runtime_error(describe(info)), _info(std::move(info)) {}

FileSystemError::FileSystemError(FileError code, const std::string& message, const std::string& path,
                                 std::optional<std::error_code> ec)
    : FileSystemError(FileErrorInfo{code, message, ec, path}) {}

DestinationExistsError::DestinationExistsError(const std::string& destination)
    : FileSystemError(FileError::AlreadyExists, "Destination already exists", destination,
                      std::make_error_code(std::errc::file_exists)) {}

FileSystemError makeErrnoError(int err, const std::string& message, const std::string& path) {
    return FileSystemError(fileErrorFromErrno(err), message, path,
                           std::error_code(err, std::generic_category()));
}

} // namespace StagingEngine::Core::IO
