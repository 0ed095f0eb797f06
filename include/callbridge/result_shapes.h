/**
 * @file result_shapes.h
 * @brief The closed set of completion payload shapes.
 *
 * Each shape is a trait struct binding together:
 * - the ResultShape tag stored alongside a pending call
 * - the C++ value type a waiter receives
 * - the continuation signature accepted by the async path
 * - the native callback typedef and the dispatch adapter of that type
 *
 * Adding a shape means adding one trait struct here, one adapter in
 * dispatch.cpp and two alternatives in PendingCall.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <callbridge/error.h>
#include <callbridge/native_api.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace callbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Shape Tag
// ─────────────────────────────────────────────────────────────────────────────

enum class ResultShape : uint8_t {
    Empty,
    Handle,
    String,
    Bytes
};

[[nodiscard]] constexpr const char* to_string(ResultShape shape) noexcept {
    switch (shape) {
        case ResultShape::Empty:  return "Empty";
        case ResultShape::Handle: return "Handle";
        case ResultShape::String: return "String";
        case ResultShape::Bytes:  return "Bytes";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief What a completion delivers to a waiter.
 *
 * value is engaged only when status is Success.
 */
template<typename Value>
struct Outcome {
    ErrorCode status = ErrorCode::Success;
    std::optional<Value> value;

    [[nodiscard]] bool succeeded() const noexcept {
        return status == ErrorCode::Success;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Shape Traits
// ─────────────────────────────────────────────────────────────────────────────

struct EmptyResult {
    static constexpr ResultShape shape = ResultShape::Empty;
    using value_type = std::monostate;
    using continuation_type = std::move_only_function<void(ErrorCode)>;
    using native_callback = callbridge_empty_cb;

    static constexpr native_callback adapter = &callbridge_dispatch_empty;

    static void resume(continuation_type& continuation, ErrorCode status, value_type&&) {
        continuation(status);
    }
};

struct HandleResult {
    static constexpr ResultShape shape = ResultShape::Handle;
    using value_type = int32_t;
    using continuation_type = std::move_only_function<void(ErrorCode, int32_t)>;
    using native_callback = callbridge_handle_cb;

    static constexpr native_callback adapter = &callbridge_dispatch_handle;

    static void resume(continuation_type& continuation, ErrorCode status, value_type&& value) {
        continuation(status, value);
    }
};

struct StringResult {
    static constexpr ResultShape shape = ResultShape::String;
    using value_type = std::string;
    using continuation_type = std::move_only_function<void(ErrorCode, std::string)>;
    using native_callback = callbridge_string_cb;

    static constexpr native_callback adapter = &callbridge_dispatch_string;

    static void resume(continuation_type& continuation, ErrorCode status, value_type&& value) {
        continuation(status, std::move(value));
    }
};

struct BytesResult {
    static constexpr ResultShape shape = ResultShape::Bytes;
    using value_type = std::vector<uint8_t>;
    using continuation_type = std::move_only_function<void(ErrorCode, std::vector<uint8_t>)>;
    using native_callback = callbridge_bytes_cb;

    static constexpr native_callback adapter = &callbridge_dispatch_bytes;

    static void resume(continuation_type& continuation, ErrorCode status, value_type&& value) {
        continuation(status, std::move(value));
    }
};

} // namespace callbridge
