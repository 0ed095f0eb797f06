/**
 * @file pending_call_registry.h
 * @brief Thread-safe map from command handle to the call awaiting it.
 *
 * The registry is the only state shared between caller threads and native
 * callback threads. Every entry is inserted exactly once and removed
 * exactly once: by the dispatch adapter when the completion arrives, or by
 * the caller when the native library rejects the call synchronously.
 *
 * Example:
 * @code
 *   PendingCallRegistry registry;
 *   registry.insert(7, UserClosure<EmptyResult>{[](ErrorCode) {}});
 *   if (auto call = registry.take(7)) {
 *       // deliver to *call
 *   }
 * @endcode
 */

#pragma once

#include <callbridge/handle_allocator.h>
#include <callbridge/pending_call.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace callbridge {

class PendingCallRegistry {
public:
    PendingCallRegistry() = default;

    // Non-copyable (owns pending promises and closures)
    PendingCallRegistry(const PendingCallRegistry&) = delete;
    PendingCallRegistry& operator=(const PendingCallRegistry&) = delete;

    // Non-movable (contains mutex)
    PendingCallRegistry(PendingCallRegistry&&) = delete;
    PendingCallRegistry& operator=(PendingCallRegistry&&) = delete;

    /**
     * @brief Register a call under a fresh command handle.
     *
     * @throws ProtocolViolationError if the handle is already present
     */
    void insert(CommandHandle handle, PendingCall call);

    /**
     * @brief Remove and return the call registered under handle.
     *
     * @return The call, or nullopt if nothing is registered (unknown handle,
     *         or already taken)
     */
    [[nodiscard]] std::optional<PendingCall> take(CommandHandle handle);

    [[nodiscard]] bool contains(CommandHandle handle) const;

    /**
     * @brief Number of calls currently awaiting completion.
     */
    [[nodiscard]] size_t size() const;

    /**
     * @brief Block until every registered call has been taken.
     *
     * @return true if the registry became empty within timeout
     */
    [[nodiscard]] bool wait_until_empty(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable emptied_;
    std::unordered_map<CommandHandle, PendingCall> calls_;
};

} // namespace callbridge
