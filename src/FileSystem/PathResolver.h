/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

/**
 * @file PathResolver.h
 * @brief Home-directory expansion and canonical destination resolution
 */
#pragma once
#include <filesystem>
#include <vector>

namespace StagingEngine::Core::IO {

/**
 * @brief Expands a leading `~` or `~user` component
 *
 * `~` uses $HOME, falling back to the passwd entry of the current user. `~user`
 * uses that user's home directory. Paths without a leading tilde, and `~user`
 * forms naming an unknown user, are returned unchanged.
 */
std::filesystem::path expandUser(const std::filesystem::path& path);

/**
 * @brief Resolves a destination to an absolute, symlink-free path
 *
 * Expands `~`, anchors relative paths at the current working directory and
 * canonicalizes the existing prefix; components that do not exist yet are kept
 * lexically normalized.
 * @throws FileSystemError InvalidPath for an empty path or one without a file name
 */
std::filesystem::path resolveDestination(const std::filesystem::path& destination);

/**
 * @brief Directories from the root down to @p dir, inclusive
 *
 * `/a/b` yields `{"/", "/a", "/a/b"}`. @p dir should be absolute.
 */
std::vector<std::filesystem::path> ancestorChain(const std::filesystem::path& dir);

} // namespace StagingEngine::Core::IO
