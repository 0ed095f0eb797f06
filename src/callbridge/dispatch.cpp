/**
 * @file dispatch.cpp
 * @brief The C callback targets that route native completions to waiters.
 *
 * Each adapter runs on a native thread, so nothing may escape it: the
 * whole routing path sits inside a try block, and failures are logged
 * or reported as protocol violations.
 *
 * @copyright GPL-2.0-or-later
 */

#include <callbridge/dispatch.h>
#include <callbridge/call_bridge.h>
#include <callbridge/logging.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

constexpr const char* kSubsystem = "dispatch";

// Handler storage (process-wide, protected by mutex)
std::mutex g_handler_mutex;
callbridge_violation_handler g_violation_handler = nullptr;
void* g_violation_userdata = nullptr;

std::atomic<uint64_t> g_violation_count{0};

template<typename Shape, typename Marshal>
void complete(callbridge_command_handle_t handle, callbridge_error_t err, Marshal&& marshal) noexcept {
    using namespace callbridge;

    const ErrorCode status = from_native(err);

    try {
        std::optional<PendingCall> call = CallBridge::global().registry().take(handle);
        if (!call) {
            report_protocol_violation(handle, "completion for an unknown command handle");
            return;
        }

        const ResultShape expected = shape_of(*call);
        if (expected != Shape::shape) {
            char message[128];
            std::snprintf(message, sizeof(message),
                          "%s completion delivered to a call expecting %s",
                          to_string(Shape::shape), to_string(expected));
            report_protocol_violation(handle, message);
            return;
        }

        CALLBRIDGE_LOG_TRACE(kSubsystem, "call %d completed with %s (%s)",
                             handle, error_code_name(status), kind_of(*call));

        if (auto* sender = std::get_if<ChannelSender<Shape>>(&*call)) {
            typename ChannelSender<Shape>::outcome_type outcome;
            outcome.status = status;
            if (status == ErrorCode::Success) {
                outcome.value.emplace(marshal());
            }
            sender->promise.set_value(std::move(outcome));
            return;
        }

        if (auto* closure = std::get_if<UserClosure<Shape>>(&*call)) {
            try {
                Shape::resume(closure->continuation, status, marshal());
            } catch (const std::exception& e) {
                CALLBRIDGE_LOG_ERROR(kSubsystem, "continuation for call %d threw: %s",
                                     handle, e.what());
            } catch (...) {
                CALLBRIDGE_LOG_ERROR(kSubsystem, "continuation for call %d threw a non-standard exception",
                                     handle);
            }
        }
    } catch (const std::exception& e) {
        CALLBRIDGE_LOG_ERROR(kSubsystem, "failed to route completion for call %d: %s",
                             handle, e.what());
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════════
// C API Implementation
// ═══════════════════════════════════════════════════════════════════════════════

extern "C" {

void callbridge_dispatch_empty(callbridge_command_handle_t command_handle,
                               callbridge_error_t err) {
    complete<callbridge::EmptyResult>(command_handle, err, [] {
        return std::monostate{};
    });
}

void callbridge_dispatch_handle(callbridge_command_handle_t command_handle,
                                callbridge_error_t err,
                                int32_t handle) {
    complete<callbridge::HandleResult>(command_handle, err, [handle] {
        return handle;
    });
}

void callbridge_dispatch_string(callbridge_command_handle_t command_handle,
                                callbridge_error_t err,
                                const char* str) {
    complete<callbridge::StringResult>(command_handle, err, [str] {
        return str ? std::string(str) : std::string();
    });
}

void callbridge_dispatch_bytes(callbridge_command_handle_t command_handle,
                               callbridge_error_t err,
                               const uint8_t* data,
                               uint32_t len) {
    complete<callbridge::BytesResult>(command_handle, err, [data, len] {
        if (!data || len == 0) {
            return std::vector<uint8_t>();
        }
        return std::vector<uint8_t>(data, data + len);
    });
}

void callbridge_set_violation_handler(callbridge_violation_handler handler, void* userdata) {
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    g_violation_handler = handler;
    g_violation_userdata = userdata;
}

uint64_t callbridge_violation_count(void) {
    return g_violation_count.load(std::memory_order_relaxed);
}

} // extern "C"

// ═══════════════════════════════════════════════════════════════════════════════
// C++ Implementation
// ═══════════════════════════════════════════════════════════════════════════════

namespace callbridge {

void report_protocol_violation(callbridge_command_handle_t command_handle,
                               const char* message) noexcept {
    const char* text = message ? message : "unspecified protocol violation";

    CALLBRIDGE_LOG_ERROR(kSubsystem, "protocol violation on call %d: %s", command_handle, text);
    g_violation_count.fetch_add(1, std::memory_order_relaxed);

    // Copy out under the lock; the handler itself runs unlocked
    callbridge_violation_handler handler = nullptr;
    void* userdata = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_handler_mutex);
        handler = g_violation_handler;
        userdata = g_violation_userdata;
    }

    if (handler) {
        handler(command_handle, text, userdata);
        return;
    }
#ifndef CALLBRIDGE_LIBRARY_MODE
    std::abort();
#endif
}

} // namespace callbridge
