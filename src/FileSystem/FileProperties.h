/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

/**
 * @file FileProperties.h
 * @brief Permission, ownership and durability helpers for local paths
 *
 * These are the building blocks AtomicWriter uses to provision parent directories
 * and to finish a published file. All functions are synchronous and throw
 * FileSystemError on failure unless documented otherwise.
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include <sys/types.h>  // uid_t, gid_t

namespace StagingEngine::Core::IO {

/**
 * @brief Resolved owner ids; an unset side is left unchanged by applyProperties()
 */
struct Ownership {
    std::optional<uid_t> uid;
    std::optional<gid_t> gid;

    bool empty() const noexcept { return !uid && !gid; }
};

/**
 * @brief Looks up user and group names in the account databases
 *
 * A name that is not a known account but consists only of digits is taken as a
 * numeric id.
 * @throws FileSystemError InvalidArgument when a name cannot be resolved
 */
Ownership resolveOwnership(const std::optional<std::string>& user, const std::optional<std::string>& group);

/**
 * @brief Sets exact permission bits and, if requested, ownership
 *
 * Permissions are replaced, not merged. Ownership is applied after the mode.
 */
void applyProperties(const std::filesystem::path& path, std::filesystem::perms permissions,
                     const Ownership& ownership);

enum class DirectoryProvisionResult {
    Created,         // this call created the directory
    AlreadyPresent,  // a directory (or something in its place) was already there
    Failed           // creation failed for another reason; error carries the cause
};

struct DirectoryProvision {
    DirectoryProvisionResult result = DirectoryProvisionResult::Failed;
    std::error_code error;
};

/**
 * @brief Creates one directory level without touching existing ones
 *
 * Never throws. EEXIST and EISDIR are reported as AlreadyPresent, as are EACCES
 * and EPERM when the entry turns out to exist. Everything else is Failed.
 * Only Created directories should receive permissions and ownership.
 */
DirectoryProvision ensureDirectory(const std::filesystem::path& path) noexcept;

// fsync helpers; directories need their own sync for a rename to be durable
void syncFile(const std::filesystem::path& path);
void syncDirectory(const std::filesystem::path& path);

} // namespace StagingEngine::Core::IO
