/**
 * @file handle_allocator.h
 * @brief Process-wide issuance of command handles.
 */

#pragma once

#include <callbridge/native_api.h>

#include <atomic>
#include <cstdint>
#include <limits>

namespace callbridge {

using CommandHandle = callbridge_command_handle_t;

/**
 * @brief Issues command handles from a monotonically increasing counter.
 *
 * Thread-safety: lock-free, callable concurrently from any thread.
 *
 * Handles start at 1 and stay positive. After INT32_MAX issuances the
 * counter wraps back to 1; a handle is only reused once its previous call
 * has long since left the registry.
 */
class HandleAllocator {
public:
    HandleAllocator() = default;

    HandleAllocator(const HandleAllocator&) = delete;
    HandleAllocator& operator=(const HandleAllocator&) = delete;

    /**
     * @brief Issue the next command handle (never 0, never negative).
     */
    [[nodiscard]] CommandHandle next() noexcept {
        uint32_t raw = counter_.fetch_add(1, std::memory_order_relaxed);
        return static_cast<CommandHandle>(raw % MaxHandle) + 1;
    }

private:
    static constexpr uint32_t MaxHandle =
        static_cast<uint32_t>(std::numeric_limits<CommandHandle>::max());

    std::atomic<uint32_t> counter_{0};
};

} // namespace callbridge
