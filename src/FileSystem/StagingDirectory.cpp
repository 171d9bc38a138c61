/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#include "StagingDirectory.h"

#include <cerrno>
#include <cstdlib>   // mkdtemp()
#include <vector>

#include "../Logging/Logger.h"
#include "FileError.h"

namespace StagingEngine::Core::IO {

StagingDirectory StagingDirectory::create(const std::filesystem::path& parent, const std::string& tag) {
    // mkdtemp creates the directory with mode 0700 (avoid mutating std::string buffer)
    std::string tmpl = (parent / (tag + ".tmp.XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw makeErrnoError(errno, "Cannot create staging directory", parent.string());
    }
    StagingDirectory staging{std::filesystem::path(buf.data())};
    STAGING_LOG_DEBUG_CAT("StagingDirectory", "Created " + staging._path.string());
    return staging;
}

StagingDirectory::StagingDirectory(StagingDirectory&& other) noexcept
    : _path(std::move(other._path)) {
    other._path.clear();
}

StagingDirectory& StagingDirectory::operator=(StagingDirectory&& other) noexcept {
    if (this != &other) {
        StagingDirectory previous(std::move(_path));
        _path = std::move(other._path);
        other._path.clear();
    }
    return *this;
}

StagingDirectory::~StagingDirectory() {
    if (_path.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
    if (ec) {
        STAGING_LOG_ERROR_CAT("StagingDirectory",
                              "Failed to remove " + _path.string() + ": " + ec.message());
    }
}

void StagingDirectory::remove() {
    if (_path.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
    if (ec) {
        throw FileSystemError(fileErrorFromErrno(ec.value()), "Cannot remove staging directory", _path.string(), ec);
    }
    STAGING_LOG_DEBUG_CAT("StagingDirectory", "Removed " + _path.string());
    _path.clear();
}

} // namespace StagingEngine::Core::IO
