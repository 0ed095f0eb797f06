/**
 * @file logging.h
 * @brief Host-routable logging for callbridge.
 *
 * Bridge messages are emitted from caller threads and from whatever thread
 * the native library completes a call on. The host installs one sink for
 * both; without a sink, messages go to stderr unless the library is built
 * with CALLBRIDGE_LIBRARY_MODE, in which case they are dropped.
 *
 * Usage:
 *   callbridge_set_log_callback(my_logger, userdata);
 *   CALLBRIDGE_LOG_ERROR("dispatch", "unknown command handle %d", handle);
 *
 * @copyright GPL-2.0-or-later
 */

#ifndef CALLBRIDGE_LOGGING_H
#define CALLBRIDGE_LOGGING_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Log severity levels, most to least severe.
 */
typedef enum callbridge_log_level {
    CALLBRIDGE_LOG_ERROR = 0,   /**< Protocol violations, lost completions */
    CALLBRIDGE_LOG_WARN  = 1,   /**< Timed-out calls, undrained shutdown */
    CALLBRIDGE_LOG_INFO  = 2,   /**< Library load, configuration */
    CALLBRIDGE_LOG_DEBUG = 3,   /**< Immediate rejections, delivery details */
    CALLBRIDGE_LOG_TRACE = 4    /**< Per-call trace */
} callbridge_log_level;

/**
 * @brief Log sink installed by the host.
 *
 * May be invoked concurrently from caller threads and native threads, and
 * must not block on a pending bridge call.
 *
 * @param level     Severity level of the message
 * @param subsystem "bridge", "dispatch", "pool" or "native"
 * @param message   The log message (null-terminated, at most 1023 bytes)
 * @param userdata  User-provided context from registration
 */
typedef void (*callbridge_log_callback)(
    callbridge_log_level level,
    const char* subsystem,
    const char* message,
    void* userdata
);

/**
 * @brief Install the log sink (NULL restores the default).
 */
void callbridge_set_log_callback(callbridge_log_callback callback, void* userdata);

/**
 * @brief Set minimum log level (default: CALLBRIDGE_LOG_INFO).
 */
void callbridge_set_log_level(callbridge_log_level level);

callbridge_log_level callbridge_get_log_level(void);

const char* callbridge_log_level_name(callbridge_log_level level);

#ifdef __cplusplus
} /* extern "C" */
#endif

#ifdef __cplusplus

namespace callbridge {

enum class LogLevel : int {
    Error = CALLBRIDGE_LOG_ERROR,
    Warn  = CALLBRIDGE_LOG_WARN,
    Info  = CALLBRIDGE_LOG_INFO,
    Debug = CALLBRIDGE_LOG_DEBUG,
    Trace = CALLBRIDGE_LOG_TRACE
};

[[nodiscard]] inline const char* log_level_name(LogLevel level) noexcept {
    return callbridge_log_level_name(static_cast<callbridge_log_level>(level));
}

/**
 * @brief Format and emit one message.
 *
 * Filtered messages return before formatting. Output longer than the sink
 * limit is cut and ends in "...". Never throws, so it is safe inside the
 * dispatch adapters.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace callbridge

#define CALLBRIDGE_LOG_ERROR(subsys, ...) \
    ::callbridge::log_printf(::callbridge::LogLevel::Error, subsys, __VA_ARGS__)

#define CALLBRIDGE_LOG_WARN(subsys, ...) \
    ::callbridge::log_printf(::callbridge::LogLevel::Warn, subsys, __VA_ARGS__)

#define CALLBRIDGE_LOG_INFO(subsys, ...) \
    ::callbridge::log_printf(::callbridge::LogLevel::Info, subsys, __VA_ARGS__)

#define CALLBRIDGE_LOG_DEBUG(subsys, ...) \
    ::callbridge::log_printf(::callbridge::LogLevel::Debug, subsys, __VA_ARGS__)

#define CALLBRIDGE_LOG_TRACE(subsys, ...) \
    ::callbridge::log_printf(::callbridge::LogLevel::Trace, subsys, __VA_ARGS__)

#endif /* __cplusplus */

#endif /* CALLBRIDGE_LOGGING_H */
