#pragma once

/**
 * @file staging_c_api.h
 * @brief Shared C ABI definitions for StagingCore
 *
 * This header is C-compatible and can be consumed by C, Rust, C#, etc.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// Export macro (works for both static and shared builds)
#if defined(_WIN32)
  #if defined(STAGINGCORE_SHARED)
    #if defined(STAGINGCORE_BUILDING)
      #define STAGING_API __declspec(dllexport)
    #else
      #define STAGING_API __declspec(dllimport)
    #endif
  #else
    #define STAGING_API
  #endif
#else
  #if defined(STAGINGCORE_SHARED)
    #define STAGING_API __attribute__((visibility("default")))
  #else
    #define STAGING_API
  #endif
#endif

// Status codes for C API functions
typedef enum StagingStatus {
    STAGING_OK = 0,
    STAGING_ERR_UNKNOWN = 1,
    STAGING_ERR_INVALID_ARG = 2,
    STAGING_ERR_NO_MEMORY = 3,
    STAGING_ERR_DESTINATION_EXISTS = 100,
    STAGING_ERR_FILE_NOT_FOUND = 101,
    STAGING_ERR_ACCESS_DENIED = 102,
    STAGING_ERR_DISK_FULL = 103,
    STAGING_ERR_INVALID_PATH = 104,
    STAGING_ERR_IO = 105
} StagingStatus;

// Booleans (explicit, stable width across languages)
typedef int32_t StagingBool; // 0 = false, non-zero = true
#define STAGING_FALSE 0
#define STAGING_TRUE  1

STAGING_API const char* staging_status_to_string(StagingStatus s); // static string, no free

#ifdef __cplusplus
} // extern "C"
#endif
