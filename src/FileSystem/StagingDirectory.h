/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

#pragma once
#include <filesystem>
#include <string>

namespace StagingEngine::Core::IO {

/**
 * @brief RAII owner of a private, uniquely named temporary directory
 *
 * The directory is created with mode 0700 as `<parent>/<tag>.tmp.XXXXXX` so that it
 * lives on the same filesystem as its siblings and can be traced back to the file
 * it stages. It is removed recursively, together with anything inside it, by
 * remove() or at the latest by the destructor.
 */
class StagingDirectory {
public:
    /**
     * @brief Creates a fresh staging directory inside @p parent
     * @param parent Existing directory that will contain the staging directory
     * @param tag Name fragment identifying what is being staged (usually a file name)
     * @throws FileSystemError if the directory cannot be created
     */
    static StagingDirectory create(const std::filesystem::path& parent, const std::string& tag);

    StagingDirectory(StagingDirectory&& other) noexcept;
    StagingDirectory& operator=(StagingDirectory&& other) noexcept;
    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    // Best-effort removal; failures are logged, never thrown
    ~StagingDirectory();

    const std::filesystem::path& path() const noexcept { return _path; }
    std::filesystem::path filePath(const std::string& name) const { return _path / name; }
    bool removed() const noexcept { return _path.empty(); }

    /**
     * @brief Removes the directory and its contents now
     *
     * Idempotent: a second call does nothing.
     * @throws FileSystemError if removal fails; the destructor will retry
     */
    void remove();

private:
    explicit StagingDirectory(std::filesystem::path path) noexcept : _path(std::move(path)) {}

    std::filesystem::path _path;
};

} // namespace StagingEngine::Core::IO
