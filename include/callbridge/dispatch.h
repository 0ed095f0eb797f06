/**
 * @file dispatch.h
 * @brief Protocol-violation reporting for the dispatch adapters.
 *
 * The adapters themselves (callbridge_dispatch_empty and friends) are
 * declared in native_api.h because they are part of the C ABI handed to
 * the native library. This header covers what happens when a completion
 * cannot be routed:
 *
 * | Condition                         | Action                               |
 * |-----------------------------------|--------------------------------------|
 * | No call registered for the handle | log ERROR, invoke violation handler  |
 * | Registered call expects other shape | log ERROR, drop call, invoke handler |
 * | Continuation throws               | log ERROR, contain                   |
 *
 * Without an installed handler a violation aborts the process, unless
 * the build defines CALLBRIDGE_LIBRARY_MODE, in which case it is logged
 * and counted only.
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef CALLBRIDGE_DISPATCH_H
#define CALLBRIDGE_DISPATCH_H

#include <callbridge/native_api.h>

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Protocol-violation handler.
 *
 * Called on the thread that observed the violation, usually a native
 * callback thread. Must not throw.
 */
typedef void (*callbridge_violation_handler)(
    callbridge_command_handle_t command_handle,
    const char* message,
    void* userdata
);

/* Pass NULL to restore the default (abort) behavior */
void callbridge_set_violation_handler(callbridge_violation_handler handler, void* userdata);

/* Violations observed since process start */
uint64_t callbridge_violation_count(void);

#ifdef __cplusplus
} /* extern "C" */
#endif

#ifdef __cplusplus

namespace callbridge {

/**
 * @brief Report a broken completion contract.
 *
 * Logs at ERROR level, increments the violation counter and invokes the
 * installed handler. Aborts when no handler is installed (see above).
 */
void report_protocol_violation(callbridge_command_handle_t command_handle,
                               const char* message) noexcept;

} // namespace callbridge

#endif /* __cplusplus */

#endif /* CALLBRIDGE_DISPATCH_H */
