// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef CHECKDIGIT_H
#define CHECKDIGIT_H

#ifdef __cplusplus
namespace checkdigit {
class base_checksum;
} // namespace checkdigit

using checkdigit_handle = checkdigit::base_checksum *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum CHECKDIGIT_RET_CODE
 *
 * Codes returned by the checksum operations.
 **/
typedef enum
{
    CHECKDIGIT_ERR_INTERNAL                 = -4,
    CHECKDIGIT_ERR_UNKNOWN_SYMBOL           = -3,
    CHECKDIGIT_ERR_INVALID_PROTECTED_STRING = -2,
    CHECKDIGIT_ERR_INVALID_ARGUMENT         = -1,
    CHECKDIGIT_OK                           = 0,
} CHECKDIGIT_RET_CODE;

/**
 * @enum CHECKDIGIT_LOG_LEVEL
 *
 * Internal logging levels.
 **/
typedef enum
{
    CHECKDIGIT_LOG_TRACE,
    CHECKDIGIT_LOG_DEBUG,
    CHECKDIGIT_LOG_INFO,
    CHECKDIGIT_LOG_WARN,
    CHECKDIGIT_LOG_ERROR,
    CHECKDIGIT_LOG_OFF,
} CHECKDIGIT_LOG_LEVEL;

#ifndef __cplusplus
typedef struct _checkdigit_handle* checkdigit_handle;
#endif

typedef struct _checkdigit_config checkdigit_config;
typedef struct _checkdigit_string checkdigit_string;

/**
 * @struct checkdigit_config
 *
 * Configuration used to select and initialise a checksum algorithm.
 **/
struct _checkdigit_config
{
    /** Name of the algorithm, e.g. "luhn", NULL selects luhn. Owned by the caller. */
    const char *algorithm;
    /** Reject characters outside of the charset instead of ignoring them */
    bool strict;
};

/**
 * @struct checkdigit_string
 *
 * String produced by the library, must be freed with checkdigit_string_free.
 **/
struct _checkdigit_string
{
    /** NUL-terminated contents */
    char *ptr;
    /** Length excluding the NUL terminator */
    uint32_t length;
};

/**
 * @typedef checkdigit_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emitted the message. (nonnull)
 * @param line The line where the message was emitted.
 * @param message The logging message. NUL-terminated
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*checkdigit_log_cb)(
    CHECKDIGIT_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * checkdigit_init
 *
 * Initialises a checksum algorithm.
 *
 * @param config Optional configuration, NULL selects a lossy luhn algorithm.
 *
 * @return Handle to the algorithm or NULL if the configuration is invalid.
 **/
checkdigit_handle checkdigit_init(const checkdigit_config *config);

/**
 * checkdigit_destroy
 *
 * Destroys a handle created by checkdigit_init.
 *
 * @param handle Handle to destroy, may be NULL.
 **/
void checkdigit_destroy(checkdigit_handle handle);

/**
 * checkdigit_compute
 *
 * Computes the check characters of an unprotected string.
 *
 * @param handle Algorithm handle. (nonnull)
 * @param str Unprotected string, not necessarily NUL-terminated. (nonnull)
 * @param length Length of the unprotected string.
 * @param result String where the check characters are stored. (nonnull)
 *
 * @return CHECKDIGIT_OK on success, CHECKDIGIT_ERR_UNKNOWN_SYMBOL if a strict
 *         algorithm found a character outside of its charset, or another
 *         error code.
 **/
CHECKDIGIT_RET_CODE checkdigit_compute(checkdigit_handle handle, const char *str,
    uint32_t length, checkdigit_string *result);

/**
 * checkdigit_generate
 *
 * Generates the protected string of an unprotected string, that is the
 * unprotected string followed by its check characters.
 *
 * @param handle Algorithm handle. (nonnull)
 * @param str Unprotected string, not necessarily NUL-terminated. (nonnull)
 * @param length Length of the unprotected string.
 * @param result String where the protected string is stored. (nonnull)
 *
 * @return CHECKDIGIT_OK on success or an error code.
 **/
CHECKDIGIT_RET_CODE checkdigit_generate(checkdigit_handle handle, const char *str,
    uint32_t length, checkdigit_string *result);

/**
 * checkdigit_validate
 *
 * Validates a protected string.
 *
 * @param handle Algorithm handle. (nonnull)
 * @param str Protected string, not necessarily NUL-terminated. (nonnull)
 * @param length Length of the protected string.
 * @param valid Whether the check characters match the rest of the string. (nonnull)
 *
 * @return CHECKDIGIT_OK on success, CHECKDIGIT_ERR_INVALID_PROTECTED_STRING if
 *         the string is too short to contain the check characters, or another
 *         error code.
 **/
CHECKDIGIT_RET_CODE checkdigit_validate(checkdigit_handle handle, const char *str,
    uint32_t length, bool *valid);

/**
 * checkdigit_string_free
 *
 * Frees the memory held by a string produced by the library.
 *
 * @param str String to free, may be NULL.
 **/
void checkdigit_string_free(checkdigit_string *str);

/**
 * checkdigit_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *checkdigit_get_version();

/**
 * checkdigit_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool checkdigit_set_log_cb(checkdigit_log_cb cb, CHECKDIGIT_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /* CHECKDIGIT_H */
