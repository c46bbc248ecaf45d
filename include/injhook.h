// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef INJHOOK_H
#define INJHOOK_H

#ifdef __cplusplus
#include <cstddef>

namespace injhook{
class table_handle;
} // namespace injhook

using injhook_handle = injhook::table_handle *;

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum INJHOOK_FUNCTION_TYPE
 *
 * Specifies how a hooked function is identified.
 **/
typedef enum
{
    // Function identified by its symbol name
    INJHOOK_FUNCTION_SYMBOL  = 0,
    // Function identified by its absolute address
    INJHOOK_FUNCTION_ADDRESS = 1,
} INJHOOK_FUNCTION_TYPE;

/**
 * @enum INJHOOK_LOG_LEVEL
 *
 * Internal event log level.
 **/
typedef enum
{
    INJHOOK_LOG_TRACE,
    INJHOOK_LOG_DEBUG,
    INJHOOK_LOG_INFO,
    INJHOOK_LOG_WARN,
    INJHOOK_LOG_ERROR,
    INJHOOK_LOG_OFF,
} INJHOOK_LOG_LEVEL;

#ifndef __cplusplus
typedef struct _injhook_handle* injhook_handle;
#endif

typedef struct _injhook_config injhook_config;
typedef struct _injhook_hook injhook_hook;

/**
 * @struct injhook_config
 *
 * Parser configuration.
 **/
struct _injhook_config
{
    /** Target architecture used to derive the highest accepted parameter
     *  index, e.g. "x86_64" or "aarch64". (nullable) */
    const char *architecture;
    /** Highest accepted parameter index, inclusive. Takes precedence over
     *  the architecture when greater than or equal to zero. */
    int32_t max_param_index;
};

/**
 * @struct injhook_hook
 *
 * Function and parameter to intercept at runtime.
 **/
struct _injhook_hook
{
    /** Whether the function is identified by symbol or address */
    INJHOOK_FUNCTION_TYPE type;
    /** Symbol name, NULL when type is INJHOOK_FUNCTION_ADDRESS */
    const char *symbol;
    /** Absolute address, 0 when type is INJHOOK_FUNCTION_SYMBOL */
    uint64_t address;
    /** Index of the parameter containing the string to inspect */
    uint32_t param_index;
    /** Index of the owning group, to be used with injhook_match */
    uint32_t group_index;
};

/**
 * @typedef injhook_log_cb
 *
 * Callback used to relay log messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message, NUL-terminated.
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*injhook_log_cb)(
    INJHOOK_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * injhook_init
 *
 * Load a rule table from a YAML or JSON source.
 *
 * @param source Rule source, not necessarily NUL-terminated. (nonnull)
 * @param length Length of the rule source.
 * @param config Optional parser configuration. (nullable)
 *
 * @return Handle to the rule table or NULL on error, the cause of the error
 *         is reported through the log callback.
 **/
injhook_handle injhook_init(const char *source, size_t length, const injhook_config *config);

/**
 * injhook_init_file
 *
 * Load a rule table from a YAML or JSON file.
 *
 * @param path NUL-terminated path to the rule file. (nonnull)
 * @param config Optional parser configuration. (nullable)
 *
 * @return Handle to the rule table or NULL on error.
 **/
injhook_handle injhook_init_file(const char *path, const injhook_config *config);

/**
 * injhook_destroy
 *
 * Destroy a rule table.
 *
 * @param handle Handle to the rule table. (nullable)
 */
void injhook_destroy(injhook_handle handle);

/**
 * injhook_group_count
 *
 * @param handle Handle to the rule table.
 *
 * @return Number of groups in the table, 0 if the handle is NULL.
 **/
uint32_t injhook_group_count(const injhook_handle handle);

/**
 * injhook_group_name
 *
 * @param handle Handle to the rule table.
 * @param group_index Index of the group.
 *
 * @return NUL-terminated name of the group or NULL if the index is invalid.
 *
 * @note The returned string is owned by the table and remains valid until
 *       injhook_destroy is called on the handle.
 **/
const char *injhook_group_name(const injhook_handle handle, uint32_t group_index);

/**
 * injhook_group_index
 *
 * Find the index of a group by name.
 *
 * @param handle Handle to the rule table.
 * @param name NUL-terminated group name. (nonnull)
 * @param group_index Output parameter in which the index is returned. (nonnull)
 *
 * @return Whether the group was found.
 **/
bool injhook_group_index(const injhook_handle handle, const char *name, uint32_t *group_index);

/**
 * injhook_token_count
 *
 * @param handle Handle to the rule table.
 * @param group_index Index of the group.
 *
 * @return Number of injection tokens of the group, 0 if the index is invalid.
 **/
uint32_t injhook_token_count(const injhook_handle handle, uint32_t group_index);

/**
 * injhook_token
 *
 * @param handle Handle to the rule table.
 * @param group_index Index of the group.
 * @param token_index Index of the token within the group.
 * @param length Output parameter in which the token length is returned. (nullable)
 *
 * @return The token, which may contain NUL bytes, or NULL if an index is invalid.
 **/
const char *injhook_token(const injhook_handle handle, uint32_t group_index,
    uint32_t token_index, size_t *length);

/**
 * injhook_hooks
 *
 * Get every function and parameter to intercept at runtime.
 *
 * @param handle Handle to the rule table.
 * @param size Output parameter in which the number of hooks is returned. (nonnull)
 *
 * @return NULL if empty, otherwise a pointer to an array with size elements.
 *
 * @note The returned array is owned by the table and remains valid until
 *       injhook_destroy is called on the handle.
 **/
const injhook_hook *injhook_hooks(const injhook_handle handle, uint32_t *size);

/**
 * injhook_match
 *
 * Check an intercepted argument against the match strings of a group. This
 * function is thread-safe and doesn't allocate.
 *
 * @param handle Handle to the rule table.
 * @param group_index Index of the group, as provided in injhook_hook.
 * @param value Argument value, not necessarily NUL-terminated. (nullable)
 * @param length Length of the argument value.
 *
 * @return Whether the value contains one of the match strings.
 **/
bool injhook_match(const injhook_handle handle, uint32_t group_index, const char *value,
    size_t length);

/**
 * injhook_match_group
 *
 * Same as injhook_match with the group identified by name.
 **/
bool injhook_match_group(const injhook_handle handle, const char *group, const char *value,
    size_t length);

/**
 * injhook_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 **/
bool injhook_set_log_cb(injhook_log_cb cb, INJHOOK_LOG_LEVEL min_level);

/**
 * injhook_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, NUL-terminated.
 **/
const char *injhook_get_version();

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*INJHOOK_H */
