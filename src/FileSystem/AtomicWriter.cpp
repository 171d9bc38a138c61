/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#include "AtomicWriter.h"

#include <cerrno>
#include <cstdio>     // rename(), renameat2()
#include <stdexcept>

#include "../Logging/Logger.h"
#include "FileError.h"
#include "PathResolver.h"

#include <fcntl.h>    // AT_FDCWD
#include <unistd.h>   // link(), unlink()

namespace StagingEngine::Core::IO {

namespace {
    constexpr const char* kLogCategory = "AtomicWriter";

    // Rename that refuses to replace an existing destination
    void renameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to) {
#if defined(__linux__) && defined(RENAME_NOREPLACE)
        if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
            return;
        }
        const int err = errno;
        if (err == EEXIST) {
            throw DestinationExistsError(to.string());
        }
        // EINVAL/ENOSYS: the filesystem or kernel lacks RENAME_NOREPLACE, fall back to link()
        if (err != EINVAL && err != ENOSYS) {
            throw makeErrnoError(err, "Cannot publish staged file", to.string());
        }
#endif
        // link() fails with EEXIST instead of replacing, which gives the same guarantee
        if (::link(from.c_str(), to.c_str()) != 0) {
            const int err = errno;
            if (err == EEXIST) {
                throw DestinationExistsError(to.string());
            }
            throw makeErrnoError(err, "Cannot publish staged file", to.string());
        }
        if (::unlink(from.c_str()) != 0) {
            // Destination is already published; the staged link goes away with the staging directory
            STAGING_LOG_DEBUG_CAT(kLogCategory, "Could not unlink staged file " + from.string());
        }
    }

    void renameReplace(const std::filesystem::path& from, const std::filesystem::path& to) {
        if (::rename(from.c_str(), to.c_str()) != 0) {
            throw makeErrnoError(errno, "Cannot publish staged file", to.string());
        }
    }
}

AtomicWriter::AtomicWriter(const std::filesystem::path& destination, AtomicWriteOptions options)
    : _options(std::move(options)),
      _destination(resolveDestination(destination)),
      _ownership(resolveOwnership(_options.user, _options.group)) {
    const auto parent = _destination.parent_path();
    const auto name = _destination.filename().string();

    provisionParents(parent);

    _staging.emplace(StagingDirectory::create(parent, name));
    _stagingPath = _staging->filePath(name);
    STAGING_LOG_DEBUG_CAT(kLogCategory, "Staging " + _destination.string() + " at " + _stagingPath.string());
}

AtomicWriter::~AtomicWriter() {
    if (_state == State::Staged) {
        STAGING_LOG_DEBUG_CAT(kLogCategory, "Discarding uncommitted write to " + _destination.string());
    }
    // _staging removes whatever is left on destruction
}

void AtomicWriter::provisionParents(const std::filesystem::path& parent) {
    for (const auto& dir : ancestorChain(parent)) {
        auto provision = ensureDirectory(dir);
        switch (provision.result) {
            case DirectoryProvisionResult::Created:
                applyProperties(dir, _options.directoryPermissions, _ownership);
                STAGING_LOG_DEBUG_CAT(kLogCategory, "Created directory " + dir.string());
                break;
            case DirectoryProvisionResult::AlreadyPresent:
                break;
            case DirectoryProvisionResult::Failed:
                // Not fatal: creating the staging directory reports the real problem if one remains
                STAGING_LOG_WARNING_CAT(kLogCategory,
                                        "Could not create directory " + dir.string() + ": " + provision.error.message());
                break;
        }
    }
}

void AtomicWriter::publish() {
    std::error_code ec;
    auto staged = std::filesystem::symlink_status(_stagingPath, ec);
    if (ec) {
        throw FileSystemError(fileErrorFromErrno(ec.value()), "Cannot inspect staged file", _stagingPath.string(), ec);
    }
    if (!std::filesystem::exists(staged)) {
        throw FileSystemError(FileError::FileNotFound, "Staged file was never written", _stagingPath.string());
    }

    if (_options.fsync) {
        syncFile(_stagingPath);
    }

    if (_options.overwrite) {
        renameReplace(_stagingPath, _destination);
    } else {
        renameNoReplace(_stagingPath, _destination);
    }
}

void AtomicWriter::commit() {
    if (_state != State::Staged) {
        throw std::logic_error("AtomicWriter already finalized for " + _destination.string());
    }

    try {
        publish();
    } catch (const FileSystemError& e) {
        STAGING_LOG_DEBUG_CAT(kLogCategory, "Publish of " + _destination.string() + " failed (" +
                                                std::string(toString(e.code())) + ")");
        _state = State::Discarded;
        _staging.reset();
        throw;
    } catch (...) {
        _state = State::Discarded;
        _staging.reset();
        throw;
    }
    // The rename happened; anything failing from here on leaves the new file in place
    _state = State::Committed;
    STAGING_LOG_DEBUG_CAT(kLogCategory, "Published " + _destination.string());

    applyProperties(_destination, _options.filePermissions, _ownership);
    if (_options.fsync) {
        syncDirectory(_destination.parent_path());
    }
    _staging->remove();
}

void AtomicWriter::discard() {
    if (_state != State::Staged) {
        throw std::logic_error("AtomicWriter already finalized for " + _destination.string());
    }
    _state = State::Discarded;
    _staging->remove();
}

void atomicWrite(const std::filesystem::path& destination, const AtomicWriteOptions& options,
                 const StagedWriteFunction& write) {
    if (!write) {
        throw std::invalid_argument("atomicWrite requires a write callback");
    }
    AtomicWriter writer(destination, options);
    write(writer.stagingPath());
    writer.commit();
}

void atomicWrite(const std::filesystem::path& destination, const StagedWriteFunction& write) {
    atomicWrite(destination, AtomicWriteOptions{}, write);
}

} // namespace StagingEngine::Core::IO
