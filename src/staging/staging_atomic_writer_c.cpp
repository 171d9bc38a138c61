/**
 * @file staging_atomic_writer_c.cpp
 * @brief Implementation of AtomicWriter C API
 */

#include <memory>
#include <new>
#include <stdexcept>
#include <string>

#include "FileSystem/AtomicWriter.h"
#include "FileSystem/FileError.h"
#include "staging/staging_atomic_writer.h"

using namespace StagingEngine::Core::IO;

/* ============================================================================
 * Handle Layout
 * ============================================================================ */

struct StagingAtomicWriterTag {
    std::unique_ptr<AtomicWriter> writer;
    std::string stagingPath;
    std::string destination;
};

/* ============================================================================
 * Exception Translation
 * ============================================================================ */

static StagingStatus to_status(FileError code) {
    switch (code) {
        case FileError::AlreadyExists:   return STAGING_ERR_IO;
        case FileError::FileNotFound:    return STAGING_ERR_FILE_NOT_FOUND;
        case FileError::AccessDenied:    return STAGING_ERR_ACCESS_DENIED;
        case FileError::DiskFull:        return STAGING_ERR_DISK_FULL;
        case FileError::InvalidPath:     return STAGING_ERR_INVALID_PATH;
        case FileError::InvalidArgument: return STAGING_ERR_INVALID_ARG;
        case FileError::IOError:         return STAGING_ERR_IO;
        default:                         return STAGING_ERR_UNKNOWN;
    }
}

static void translate_exception(StagingStatus* status) {
    try {
        throw;
    } catch (const std::bad_alloc&) {
        if (status) *status = STAGING_ERR_NO_MEMORY;
    } catch (const DestinationExistsError&) {
        if (status) *status = STAGING_ERR_DESTINATION_EXISTS;
    } catch (const FileSystemError& e) {
        if (status) *status = to_status(e.code());
    } catch (const std::invalid_argument&) {
        if (status) *status = STAGING_ERR_INVALID_ARG;
    } catch (...) {
        if (status) *status = STAGING_ERR_UNKNOWN;
    }
}

/* ============================================================================
 * Type Conversions
 * ============================================================================ */

static AtomicWriteOptions to_cpp_write_options(const StagingWriteOptions* opts) {
    AtomicWriteOptions wo;
    if (!opts) return wo;

    wo.overwrite = opts->overwrite != STAGING_FALSE;
    wo.directoryPermissions = static_cast<std::filesystem::perms>(opts->directory_permissions & 07777);
    wo.filePermissions = static_cast<std::filesystem::perms>(opts->file_permissions & 07777);
    if (opts->user) wo.user = std::string(opts->user);
    if (opts->group) wo.group = std::string(opts->group);
    wo.fsync = opts->fsync != STAGING_FALSE;
    return wo;
}

/* ============================================================================
 * AtomicWriter Implementation
 * ============================================================================ */

extern "C" {

const char* staging_status_to_string(StagingStatus s) {
    switch (s) {
        case STAGING_OK:                     return "ok";
        case STAGING_ERR_UNKNOWN:            return "unknown error";
        case STAGING_ERR_INVALID_ARG:        return "invalid argument";
        case STAGING_ERR_NO_MEMORY:          return "out of memory";
        case STAGING_ERR_DESTINATION_EXISTS: return "destination already exists";
        case STAGING_ERR_FILE_NOT_FOUND:     return "file not found";
        case STAGING_ERR_ACCESS_DENIED:      return "access denied";
        case STAGING_ERR_DISK_FULL:          return "disk full";
        case STAGING_ERR_INVALID_PATH:       return "invalid path";
        case STAGING_ERR_IO:                 return "i/o error";
    }
    return "unknown status";
}

void staging_write_options_init(StagingWriteOptions* options) {
    if (!options) return;

    options->overwrite = STAGING_FALSE;
    options->directory_permissions = 0750;
    options->file_permissions = 0600;
    options->user = NULL;
    options->group = NULL;
    options->fsync = STAGING_TRUE;
}

staging_AtomicWriter staging_atomic_writer_create(const char* destination, const StagingWriteOptions* options,
                                                  StagingStatus* status) {
    if (!status) return nullptr;
    if (!destination) {
        *status = STAGING_ERR_INVALID_ARG;
        return nullptr;
    }

    try {
        auto handle = std::make_unique<StagingAtomicWriterTag>();
        handle->writer = std::make_unique<AtomicWriter>(destination, to_cpp_write_options(options));
        handle->stagingPath = handle->writer->stagingPath().string();
        handle->destination = handle->writer->destination().string();
        *status = STAGING_OK;
        return handle.release();
    } catch (...) {
        translate_exception(status);
        return nullptr;
    }
}

const char* staging_atomic_writer_staging_path(staging_AtomicWriter writer) {
    if (!writer) return nullptr;
    return writer->stagingPath.c_str();
}

const char* staging_atomic_writer_destination(staging_AtomicWriter writer) {
    if (!writer) return nullptr;
    return writer->destination.c_str();
}

void staging_atomic_writer_commit(staging_AtomicWriter writer, StagingStatus* status) {
    if (!status) return;
    if (!writer || !writer->writer) {
        *status = STAGING_ERR_INVALID_ARG;
        return;
    }

    try {
        writer->writer->commit();
        *status = STAGING_OK;
    } catch (const std::logic_error&) {
        *status = STAGING_ERR_INVALID_ARG;
    } catch (...) {
        translate_exception(status);
    }
}

void staging_atomic_writer_discard(staging_AtomicWriter writer, StagingStatus* status) {
    if (!status) return;
    if (!writer || !writer->writer) {
        *status = STAGING_ERR_INVALID_ARG;
        return;
    }

    try {
        writer->writer->discard();
        *status = STAGING_OK;
    } catch (const std::logic_error&) {
        *status = STAGING_ERR_INVALID_ARG;
    } catch (...) {
        translate_exception(status);
    }
}

void staging_atomic_writer_destroy(staging_AtomicWriter writer) {
    if (!writer) return;
    delete writer;
}

void staging_atomic_write(const char* destination, const StagingWriteOptions* options,
                          staging_write_callback callback, void* user_data, StagingStatus* status) {
    if (!status) return;
    if (!destination || !callback) {
        *status = STAGING_ERR_INVALID_ARG;
        return;
    }

    try {
        AtomicWriter writer(destination, to_cpp_write_options(options));
        const std::string staged = writer.stagingPath().string();

        StagingStatus callbackStatus = STAGING_ERR_UNKNOWN;
        if (callback(staged.c_str(), user_data, &callbackStatus) != 0) {
            writer.discard();
            *status = callbackStatus == STAGING_OK ? STAGING_ERR_UNKNOWN : callbackStatus;
            return;
        }

        writer.commit();
        *status = STAGING_OK;
    } catch (...) {
        translate_exception(status);
    }
}

}  // extern "C"
