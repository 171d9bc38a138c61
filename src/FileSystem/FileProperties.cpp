/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#include "FileProperties.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>

#include "FileError.h"

#include <fcntl.h>     // open()
#include <grp.h>       // getgrnam_r()
#include <pwd.h>       // getpwnam_r()
#include <sys/stat.h>  // mkdir()
#include <unistd.h>    // chown(), fsync(), close(), sysconf()

namespace StagingEngine::Core::IO {

namespace {
    size_t lookupBufferSize(int name) {
        long hint = ::sysconf(name);
        return hint > 0 ? static_cast<size_t>(hint) : 16384;
    }

    template <typename Id>
    std::optional<Id> parseNumericId(const std::string& text) {
        if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        Id value{};
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
        return value;
    }

    uid_t lookupUser(const std::string& name) {
        std::string buf(lookupBufferSize(_SC_GETPW_R_SIZE_MAX), '\0');
        struct passwd pwd {};
        struct passwd* result = nullptr;
        int rc = ::getpwnam_r(name.c_str(), &pwd, buf.data(), buf.size(), &result);
        if (rc == 0 && result) return result->pw_uid;
        if (auto numeric = parseNumericId<uid_t>(name)) return *numeric;
        throw FileSystemError(FileError::InvalidArgument, "Unknown user", name,
                              rc != 0 ? std::optional<std::error_code>(std::error_code(rc, std::generic_category()))
                                      : std::nullopt);
    }

    gid_t lookupGroup(const std::string& name) {
        std::string buf(lookupBufferSize(_SC_GETGR_R_SIZE_MAX), '\0');
        struct group grp {};
        struct group* result = nullptr;
        int rc = ::getgrnam_r(name.c_str(), &grp, buf.data(), buf.size(), &result);
        if (rc == 0 && result) return result->gr_gid;
        if (auto numeric = parseNumericId<gid_t>(name)) return *numeric;
        throw FileSystemError(FileError::InvalidArgument, "Unknown group", name,
                              rc != 0 ? std::optional<std::error_code>(std::error_code(rc, std::generic_category()))
                                      : std::nullopt);
    }

    void syncPath(const std::filesystem::path& path, int flags, const char* what) {
        int fd = ::open(path.c_str(), flags | O_CLOEXEC);
        if (fd < 0) {
            throw makeErrnoError(errno, std::string("Cannot open for ") + what, path.string());
        }
        if (::fsync(fd) != 0) {
            const int err = errno;  // snapshot before close
            ::close(fd);
            throw makeErrnoError(err, std::string(what) + " failed", path.string());
        }
        ::close(fd);
    }
}

Ownership resolveOwnership(const std::optional<std::string>& user, const std::optional<std::string>& group) {
    Ownership owner;
    if (user) owner.uid = lookupUser(*user);
    if (group) owner.gid = lookupGroup(*group);
    return owner;
}

void applyProperties(const std::filesystem::path& path, std::filesystem::perms permissions,
                     const Ownership& ownership) {
    std::error_code ec;
    std::filesystem::permissions(path, permissions & std::filesystem::perms::mask,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        throw FileSystemError(fileErrorFromErrno(ec.value()), "Cannot set permissions", path.string(), ec);
    }

    if (ownership.empty()) return;

    const uid_t uid = ownership.uid ? *ownership.uid : static_cast<uid_t>(-1);
    const gid_t gid = ownership.gid ? *ownership.gid : static_cast<gid_t>(-1);
    if (::chown(path.c_str(), uid, gid) != 0) {
        throw makeErrnoError(errno, "Cannot change ownership", path.string());
    }
}

DirectoryProvision ensureDirectory(const std::filesystem::path& path) noexcept {
    DirectoryProvision out;
    if (::mkdir(path.c_str(), 0777) == 0) {
        out.result = DirectoryProvisionResult::Created;
        return out;
    }

    const int err = errno;
    out.error = std::error_code(err, std::generic_category());
    switch (err) {
        case EEXIST:
        case EISDIR:
            out.result = DirectoryProvisionResult::AlreadyPresent;
            break;
        case EACCES:
        case EPERM: {
            // Some filesystems check write access before existence
            std::error_code ec;
            out.result = std::filesystem::exists(path, ec) ? DirectoryProvisionResult::AlreadyPresent
                                                           : DirectoryProvisionResult::Failed;
            break;
        }
        default:
            out.result = DirectoryProvisionResult::Failed;
            break;
    }
    return out;
}

void syncFile(const std::filesystem::path& path) {
    syncPath(path, O_RDONLY, "file fsync");
}

void syncDirectory(const std::filesystem::path& path) {
    syncPath(path, O_RDONLY | O_DIRECTORY, "directory fsync");
}

} // namespace StagingEngine::Core::IO
