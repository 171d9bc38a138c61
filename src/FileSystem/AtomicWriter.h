/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Staging Core project.
 */

/**
 * @file AtomicWriter.h
 * @brief Stage a file privately, then publish it to its destination in one rename
 *
 * AtomicWriter provisions the destination's parent directories, creates a private
 * staging directory beside the destination and hands out a path inside it. The
 * caller writes that path however it likes. commit() moves the staged file into
 * place with a single atomic rename and applies the configured permissions and
 * ownership; if the writer is destroyed without a commit the staged data is
 * discarded and the destination is never touched.
 *
 * Readers of the destination observe either its previous state or the complete new
 * file, never a partial one. Parent directories created on the way are not rolled
 * back when the write is discarded.
 *
 * @code
 * atomicWrite("~/reports/today.csv", [](const std::filesystem::path& staged) {
 *     std::ofstream out(staged, std::ios::binary);
 *     out << "id,value\n";
 * });
 * @endcode
 */
#pragma once
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "FileProperties.h"
#include "StagingDirectory.h"

namespace StagingEngine::Core::IO {

/**
 * @brief Options controlling an atomic write
 * @param overwrite Replace the destination if it already exists; otherwise publishing fails
 *        with DestinationExistsError
 * @param directoryPermissions Mode given to every parent directory this write creates
 *        (default u=rwx,g=rx,o=)
 * @param filePermissions Exact mode of the published file (default u=rw)
 * @param user Owner applied to created directories and the published file
 * @param group Group applied to created directories and the published file
 * @param fsync Flush the staged file before publishing and the parent directory after
 */
struct AtomicWriteOptions {
    bool overwrite = false;
    std::filesystem::perms directoryPermissions = std::filesystem::perms::owner_all |
                                                  std::filesystem::perms::group_read |
                                                  std::filesystem::perms::group_exec;
    std::filesystem::perms filePermissions = std::filesystem::perms::owner_read |
                                             std::filesystem::perms::owner_write;
    std::optional<std::string> user;
    std::optional<std::string> group;
    bool fsync = true;
};

class AtomicWriter {
public:
    enum class State { Staged, Committed, Discarded };

    /**
     * @brief Prepares a staged write for @p destination
     *
     * Resolves the destination once (`~` expanded, symlinks followed), looks up the
     * requested owner, creates missing parent directories one level at a time and
     * creates the staging directory. Nothing is written to the destination yet.
     * @throws FileSystemError on an invalid destination, unknown user/group, failure to
     *         apply properties to a created directory, or failure to create the staging
     *         directory
     */
    explicit AtomicWriter(const std::filesystem::path& destination, AtomicWriteOptions options = {});
    ~AtomicWriter();

    AtomicWriter(const AtomicWriter&) = delete;
    AtomicWriter& operator=(const AtomicWriter&) = delete;

    // Resolved absolute destination
    const std::filesystem::path& destination() const noexcept { return _destination; }
    // Path the caller writes; shares the destination's file name
    const std::filesystem::path& stagingPath() const noexcept { return _stagingPath; }
    const AtomicWriteOptions& options() const noexcept { return _options; }
    State state() const noexcept { return _state; }

    /**
     * @brief Publishes the staged file and removes the staging directory
     *
     * Publishing is a single rename. Without overwrite it refuses to replace an
     * existing destination. After publishing, filePermissions and the requested
     * ownership are applied to the destination and the parent directory is synced.
     * The writer is Committed once the rename succeeds, even if a later step throws;
     * a failure before that point leaves it Discarded.
     * @throws DestinationExistsError if overwrite is off and the destination exists
     * @throws FileSystemError if the staged file is missing or any step fails
     * @throws std::logic_error if the writer was already committed or discarded
     */
    void commit();

    /**
     * @brief Drops the staged file without touching the destination
     * @throws FileSystemError if the staging directory cannot be removed
     * @throws std::logic_error if the writer was already committed or discarded
     */
    void discard();

private:
    void provisionParents(const std::filesystem::path& parent);
    void publish();

    AtomicWriteOptions _options;
    std::filesystem::path _destination;
    Ownership _ownership;
    std::optional<StagingDirectory> _staging;
    std::filesystem::path _stagingPath;
    State _state = State::Staged;
};

using StagedWriteFunction = std::function<void(const std::filesystem::path& stagingPath)>;

/**
 * @brief Runs @p write against a staged path and publishes the result if it returns
 *
 * If @p write throws, the staged data is removed, the destination is left as it was and
 * the exception propagates unchanged.
 * @param destination Final file location (absolute, relative or `~`-prefixed)
 * @param options Overwrite, permission, ownership and durability settings
 * @param write Callback that creates the file at the path it receives
 */
void atomicWrite(const std::filesystem::path& destination, const AtomicWriteOptions& options,
                 const StagedWriteFunction& write);

void atomicWrite(const std::filesystem::path& destination, const StagedWriteFunction& write);

} // namespace StagingEngine::Core::IO
