/**
 * @file logging.cpp
 * @brief Host-routable logging.
 *
 * The sink is swapped under a mutex and read as one snapshot, so a message
 * never pairs one host's callback with another host's userdata. The level
 * filter is a lock-free atomic: native callback threads pay nothing for
 * filtered messages.
 *
 * @copyright GPL-2.0-or-later
 */

#include <callbridge/logging.h>

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace {

struct LogSink {
    callbridge_log_callback callback = nullptr;
    void* userdata = nullptr;
};

std::mutex g_sink_mutex;
LogSink g_sink;

std::atomic<callbridge_log_level> g_min_log_level{CALLBRIDGE_LOG_INFO};

constexpr size_t kMessageCapacity = 1024;
constexpr char kEllipsis[] = "...";

LogSink current_sink() {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    return g_sink;
}

bool filtered(callbridge::LogLevel level) noexcept {
    return static_cast<int>(level) > static_cast<int>(g_min_log_level.load(std::memory_order_relaxed));
}

void emit(callbridge_log_level level, const char* subsystem, const char* message) noexcept {
    const LogSink sink = current_sink();
    if (sink.callback) {
        sink.callback(level, subsystem, message, sink.userdata);
        return;
    }
#ifndef CALLBRIDGE_LIBRARY_MODE
    std::fprintf(stderr, "[%s] %s: %s\n", callbridge_log_level_name(level), subsystem, message);
#endif
}

} // anonymous namespace

extern "C" {

void callbridge_set_log_callback(callbridge_log_callback callback, void* userdata) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = LogSink{callback, userdata};
}

void callbridge_set_log_level(callbridge_log_level level) {
    g_min_log_level.store(level, std::memory_order_relaxed);
}

callbridge_log_level callbridge_get_log_level(void) {
    return g_min_log_level.load(std::memory_order_relaxed);
}

const char* callbridge_log_level_name(callbridge_log_level level) {
    switch (level) {
        case CALLBRIDGE_LOG_ERROR: return "ERROR";
        case CALLBRIDGE_LOG_WARN:  return "WARN";
        case CALLBRIDGE_LOG_INFO:  return "INFO";
        case CALLBRIDGE_LOG_DEBUG: return "DEBUG";
        case CALLBRIDGE_LOG_TRACE: return "TRACE";
    }
    return "UNKNOWN";
}

} // extern "C"

namespace callbridge {

void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept {
    if (filtered(level)) {
        return;
    }

    char message[kMessageCapacity];
    va_list args;
    va_start(args, fmt);
    const int needed = std::vsnprintf(message, sizeof(message), fmt, args);
    va_end(args);

    if (needed < 0) {
        std::snprintf(message, sizeof(message), "(unformattable message: %s)", fmt);
    } else if (static_cast<size_t>(needed) >= sizeof(message)) {
        std::memcpy(message + sizeof(message) - sizeof(kEllipsis), kEllipsis, sizeof(kEllipsis));
    }

    emit(static_cast<callbridge_log_level>(level), subsystem ? subsystem : "bridge", message);
}

} // namespace callbridge
