/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#include "PathResolver.h"

#include <optional>
#include <string>

#include "../CoreCommon.h"
#include "FileError.h"

#include <pwd.h>       // getpwnam_r(), getpwuid_r()
#include <unistd.h>    // getuid(), sysconf()

namespace StagingEngine::Core::IO {

namespace {
    size_t passwdBufferSize() {
        long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
        return hint > 0 ? static_cast<size_t>(hint) : 16384;
    }

    // Home directory from the passwd database; by name when given, else the current uid
    std::optional<std::string> passwdHome(const std::string* name) {
        std::string buf(passwdBufferSize(), '\0');
        struct passwd pwd {};
        struct passwd* result = nullptr;
        int rc = name ? ::getpwnam_r(name->c_str(), &pwd, buf.data(), buf.size(), &result)
                      : ::getpwuid_r(::getuid(), &pwd, buf.data(), buf.size(), &result);
        if (rc != 0 || !result || !result->pw_dir) return std::nullopt;
        return std::string(result->pw_dir);
    }
}

std::filesystem::path expandUser(const std::filesystem::path& path) {
    const std::string s = path.string();
    if (s.empty() || s[0] != '~') return path;

    const auto slash = s.find('/');
    const std::string name = s.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
    const std::string rest = slash == std::string::npos ? std::string() : s.substr(slash + 1);

    std::optional<std::string> home;
    if (name.empty()) {
        home = safeGetEnv("HOME");
        if (!home) home = passwdHome(nullptr);
    } else {
        home = passwdHome(&name);
    }
    if (!home) return path;

    std::filesystem::path expanded(*home);
    return rest.empty() ? expanded : expanded / rest;
}

std::filesystem::path resolveDestination(const std::filesystem::path& destination) {
    if (destination.empty()) {
        throw FileSystemError(FileError::InvalidPath, "Destination path is empty");
    }

    const auto expanded = expandUser(destination);
    const auto name = expanded.filename();
    if (name.empty() || name == "." || name == "..") {
        throw FileSystemError(FileError::InvalidPath, "Destination does not name a file", destination.string());
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(expanded, ec);
    if (ec) {
        throw FileSystemError(FileError::InvalidPath, "Cannot make destination absolute", expanded.string(), ec);
    }
    auto resolved = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        throw FileSystemError(fileErrorFromErrno(ec.value()), "Cannot resolve destination", absolute.string(), ec);
    }
    if (resolved.filename().empty() || resolved == resolved.root_path()) {
        throw FileSystemError(FileError::InvalidPath, "Destination does not name a file", resolved.string());
    }
    return resolved;
}

std::vector<std::filesystem::path> ancestorChain(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> chain;
    std::filesystem::path current;
    for (const auto& part : dir) {
        if (part.empty()) continue;
        current /= part;
        chain.push_back(current);
    }
    return chain;
}

} // namespace StagingEngine::Core::IO
