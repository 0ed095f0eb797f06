/**
 * @file native_api.h
 * @brief C ABI of the native pool library wrapped by callbridge.
 *
 * Every native operation follows one calling convention:
 *
 *   status = native_fn(command_handle, arg..., callback);
 *
 * A non-zero immediate status means the call was rejected synchronously and
 * the callback will never fire for that command handle. A zero immediate
 * status means work was scheduled, and the native runtime invokes
 * callback(command_handle, status, result...) exactly once, on a thread of
 * its own choosing.
 *
 * DESIGN DECISIONS:
 * - Pure C header (compiles as C11 and C++23)
 * - Status values mirror the native library's error domain verbatim
 * - Bridge-local statuses live in the 1000 range and never come from native code
 * - Symbols are resolved at runtime into callbridge_pool_api_t
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef CALLBRIDGE_NATIVE_API_H
#define CALLBRIDGE_NATIVE_API_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =========================================================================
 * HANDLES & STATUS
 * ========================================================================= */

/** Correlation token pairing a native call with its completion. Never 0. */
typedef int32_t callbridge_command_handle_t;

/** Handle to an opened pool, produced by indy_open_pool_ledger. */
typedef int32_t callbridge_pool_handle_t;

typedef int32_t callbridge_error_t;

#define CALLBRIDGE_OK                                   0

/* Common errors (100-199) */
#define CALLBRIDGE_ERR_COMMON_INVALID_PARAM1          100
#define CALLBRIDGE_ERR_COMMON_INVALID_PARAM2          101
#define CALLBRIDGE_ERR_COMMON_INVALID_PARAM3          102
#define CALLBRIDGE_ERR_COMMON_INVALID_PARAM4          103
#define CALLBRIDGE_ERR_COMMON_INVALID_PARAM5          104
#define CALLBRIDGE_ERR_COMMON_INVALID_PARAM6          105
#define CALLBRIDGE_ERR_COMMON_INVALID_STATE           112
#define CALLBRIDGE_ERR_COMMON_INVALID_STRUCTURE       113
#define CALLBRIDGE_ERR_COMMON_IO                      114

/* Wallet errors (200-299) */
#define CALLBRIDGE_ERR_WALLET_INVALID_HANDLE          200
#define CALLBRIDGE_ERR_WALLET_ALREADY_EXISTS          203
#define CALLBRIDGE_ERR_WALLET_NOT_FOUND               204

/* Pool and ledger errors (300-399) */
#define CALLBRIDGE_ERR_POOL_LEDGER_NOT_CREATED        300
#define CALLBRIDGE_ERR_POOL_LEDGER_INVALID_HANDLE     301
#define CALLBRIDGE_ERR_POOL_LEDGER_TERMINATED         302
#define CALLBRIDGE_ERR_LEDGER_NO_CONSENSUS            303
#define CALLBRIDGE_ERR_LEDGER_INVALID_TRANSACTION     304
#define CALLBRIDGE_ERR_LEDGER_SECURITY                305
#define CALLBRIDGE_ERR_POOL_CONFIG_ALREADY_EXISTS     306
#define CALLBRIDGE_ERR_POOL_LEDGER_TIMEOUT            307
#define CALLBRIDGE_ERR_POOL_INCOMPATIBLE_PROTOCOL     308
#define CALLBRIDGE_ERR_LEDGER_NOT_FOUND               309

/* Bridge-local (1000-1099), synthesized by callbridge itself */
#define CALLBRIDGE_ERR_WAIT_TIMEOUT                  1000
#define CALLBRIDGE_ERR_PROTOCOL_VIOLATION            1001
#define CALLBRIDGE_ERR_NATIVE_LIBRARY_NOT_FOUND      1002
#define CALLBRIDGE_ERR_NATIVE_SYMBOL_MISSING         1003
#define CALLBRIDGE_ERR_INVALID_CONFIG                1004

/* =========================================================================
 * CALLBACK SHAPES
 * ========================================================================= */

/** Completion carrying no value. */
typedef void (*callbridge_empty_cb)(
    callbridge_command_handle_t command_handle,
    callbridge_error_t err
);

/** Completion carrying one 32-bit handle. */
typedef void (*callbridge_handle_cb)(
    callbridge_command_handle_t command_handle,
    callbridge_error_t err,
    int32_t handle
);

/** Completion carrying one NUL-terminated UTF-8 string (may be NULL on error). */
typedef void (*callbridge_string_cb)(
    callbridge_command_handle_t command_handle,
    callbridge_error_t err,
    const char* str
);

/** Completion carrying one byte buffer (data may be NULL when len is 0). */
typedef void (*callbridge_bytes_cb)(
    callbridge_command_handle_t command_handle,
    callbridge_error_t err,
    const uint8_t* data,
    uint32_t len
);

/* =========================================================================
 * DISPATCH ADAPTERS
 * ========================================================================= */

/*
 * The fixed callback targets handed to the native library. They route a
 * completion to whichever waiter registered the command handle. Safe to call
 * from any thread; never block and never unwind.
 */
void callbridge_dispatch_empty(callbridge_command_handle_t command_handle,
                               callbridge_error_t err);

void callbridge_dispatch_handle(callbridge_command_handle_t command_handle,
                                callbridge_error_t err,
                                int32_t handle);

void callbridge_dispatch_string(callbridge_command_handle_t command_handle,
                                callbridge_error_t err,
                                const char* str);

void callbridge_dispatch_bytes(callbridge_command_handle_t command_handle,
                               callbridge_error_t err,
                               const uint8_t* data,
                               uint32_t len);

/* =========================================================================
 * POOL OPERATIONS
 * ========================================================================= */

typedef callbridge_error_t (*callbridge_create_pool_ledger_config_fn)(
    callbridge_command_handle_t command_handle,
    const char* config_name,
    const char* config,
    callbridge_empty_cb cb
);

typedef callbridge_error_t (*callbridge_open_pool_ledger_fn)(
    callbridge_command_handle_t command_handle,
    const char* config_name,
    const char* config,             /* NULL = library defaults */
    callbridge_handle_cb cb
);

typedef callbridge_error_t (*callbridge_refresh_pool_ledger_fn)(
    callbridge_command_handle_t command_handle,
    callbridge_pool_handle_t pool_handle,
    callbridge_empty_cb cb
);

typedef callbridge_error_t (*callbridge_list_pools_fn)(
    callbridge_command_handle_t command_handle,
    callbridge_string_cb cb
);

typedef callbridge_error_t (*callbridge_close_pool_ledger_fn)(
    callbridge_command_handle_t command_handle,
    callbridge_pool_handle_t pool_handle,
    callbridge_empty_cb cb
);

typedef callbridge_error_t (*callbridge_delete_pool_ledger_config_fn)(
    callbridge_command_handle_t command_handle,
    const char* config_name,
    callbridge_empty_cb cb
);

typedef callbridge_error_t (*callbridge_set_protocol_version_fn)(
    callbridge_command_handle_t command_handle,
    size_t protocol_version,
    callbridge_empty_cb cb
);

/**
 * @brief Resolved pool symbol table.
 *
 * Filled by NativeLibrary from the shared library, or by a host/test that
 * provides the operations in-process. All members must be non-NULL.
 */
typedef struct {
    callbridge_create_pool_ledger_config_fn create_pool_ledger_config;
    callbridge_open_pool_ledger_fn          open_pool_ledger;
    callbridge_refresh_pool_ledger_fn       refresh_pool_ledger;
    callbridge_list_pools_fn                list_pools;
    callbridge_close_pool_ledger_fn         close_pool_ledger;
    callbridge_delete_pool_ledger_config_fn delete_pool_ledger_config;
    callbridge_set_protocol_version_fn      set_protocol_version;
} callbridge_pool_api_t;

/* Exported symbol names in the native library */
#define CALLBRIDGE_SYM_CREATE_POOL_LEDGER_CONFIG  "indy_create_pool_ledger_config"
#define CALLBRIDGE_SYM_OPEN_POOL_LEDGER           "indy_open_pool_ledger"
#define CALLBRIDGE_SYM_REFRESH_POOL_LEDGER        "indy_refresh_pool_ledger"
#define CALLBRIDGE_SYM_LIST_POOLS                 "indy_list_pools"
#define CALLBRIDGE_SYM_CLOSE_POOL_LEDGER          "indy_close_pool_ledger"
#define CALLBRIDGE_SYM_DELETE_POOL_LEDGER_CONFIG  "indy_delete_pool_ledger_config"
#define CALLBRIDGE_SYM_SET_PROTOCOL_VERSION       "indy_set_protocol_version"

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* CALLBRIDGE_NATIVE_API_H */
