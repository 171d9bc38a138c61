#pragma once

/**
 * @file staging_atomic_writer.h
 * @brief C API for AtomicWriter - stage a file, then publish it atomically
 *
 * Two forms are offered. The handle form mirrors the C++ class: create a writer,
 * write the file at its staging path, then commit. Destroying an uncommitted writer
 * discards the staged data. The callback form runs a callback against the staging
 * path and commits only if the callback returns 0.
 */

#include "staging/staging_c_api.h"

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Types
 * ============================================================================ */

typedef struct StagingAtomicWriterTag* staging_AtomicWriter;

/**
 * @brief Options for an atomic write
 *
 * Always initialize with staging_write_options_init() before changing fields.
 * user/group may be NULL to leave ownership unchanged.
 */
typedef struct StagingWriteOptions
{
    StagingBool overwrite;          /**< Replace an existing destination */
    uint32_t directory_permissions; /**< Mode bits for created parent directories (default 0750) */
    uint32_t file_permissions;      /**< Mode bits for the published file (default 0600) */
    const char* user;               /**< Owner name or numeric id, or NULL */
    const char* group;              /**< Group name or numeric id, or NULL */
    StagingBool fsync;              /**< Flush file and parent directory around the rename */
} StagingWriteOptions;

/**
 * @brief Writes the file at staging_path
 * @return 0 to publish, non-zero to discard. The callback may set *status to report
 *         why it failed; it is pre-set to STAGING_ERR_UNKNOWN for non-zero returns.
 */
typedef int (*staging_write_callback)(const char* staging_path, void* user_data, StagingStatus* status);

/* ============================================================================
 * Options
 * ============================================================================ */

STAGING_API void staging_write_options_init(StagingWriteOptions* options);

/* ============================================================================
 * Handle API
 * ============================================================================ */

/**
 * @brief Prepares a staged write for destination
 *
 * Creates missing parent directories and the staging directory.
 *
 * @param destination Final file path (required)
 * @param options Options, or NULL for defaults
 * @param status Error reporting (required)
 * @return Writer handle, or NULL on failure
 * @threadsafety NOT thread-safe - do not use a writer concurrently
 *
 * @code
 * StagingStatus status;
 * staging_AtomicWriter w = staging_atomic_writer_create("out/data.bin", NULL, &status);
 * FILE* f = fopen(staging_atomic_writer_staging_path(w), "wb");
 * fwrite(buf, 1, len, f);
 * fclose(f);
 * staging_atomic_writer_commit(w, &status);
 * staging_atomic_writer_destroy(w);
 * @endcode
 */
STAGING_API staging_AtomicWriter staging_atomic_writer_create(const char* destination,
                                                              const StagingWriteOptions* options,
                                                              StagingStatus* status);

/**
 * @brief Path the caller must write (borrowed; valid until destroy)
 */
STAGING_API const char* staging_atomic_writer_staging_path(staging_AtomicWriter writer);

/**
 * @brief Resolved destination path (borrowed; valid until destroy)
 */
STAGING_API const char* staging_atomic_writer_destination(staging_AtomicWriter writer);

/**
 * @brief Publishes the staged file
 *
 * Reports STAGING_ERR_DESTINATION_EXISTS only if overwrite was off and the destination
 * exists. A writer can be committed at most once; a commit that fails before the rename
 * discards the staged data.
 */
STAGING_API void staging_atomic_writer_commit(staging_AtomicWriter writer, StagingStatus* status);

/**
 * @brief Drops the staged data without touching the destination
 *
 * Reports STAGING_ERR_INVALID_ARG if the writer was already committed or discarded.
 * The handle must still be destroyed.
 */
STAGING_API void staging_atomic_writer_discard(staging_AtomicWriter writer, StagingStatus* status);

/**
 * @brief Destroys a writer, discarding the staged data if it was not committed
 * @param writer Writer to destroy (can be NULL)
 */
STAGING_API void staging_atomic_writer_destroy(staging_AtomicWriter writer);

/* ============================================================================
 * Callback API
 * ============================================================================ */

/**
 * @brief Stages, writes via callback and publishes in one call
 *
 * @param destination Final file path (required)
 * @param options Options, or NULL for defaults
 * @param callback Writer callback (required)
 * @param user_data Passed through to callback
 * @param status Error reporting (required)
 */
STAGING_API void staging_atomic_write(const char* destination, const StagingWriteOptions* options,
                                      staging_write_callback callback, void* user_data, StagingStatus* status);

#ifdef __cplusplus
} // extern "C"
#endif
