/**
 * @file pending_call_registry.cpp
 * @brief PendingCallRegistry implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include <callbridge/pending_call_registry.h>
#include <callbridge/exceptions.h>

#include <utility>

namespace callbridge {

void PendingCallRegistry::insert(CommandHandle handle, PendingCall call) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = calls_.try_emplace(handle, std::move(call));
    if (!inserted) {
        throw ProtocolViolationError(handle, "command handle is already registered");
    }
}

std::optional<PendingCall> PendingCallRegistry::take(CommandHandle handle) {
    std::optional<PendingCall> call;
    bool now_empty = false;
    {
        std::lock_guard lock(mutex_);
        auto node = calls_.extract(handle);
        if (node.empty()) {
            return std::nullopt;
        }
        call.emplace(std::move(node.mapped()));
        now_empty = calls_.empty();
    }
    if (now_empty) {
        emptied_.notify_all();
    }
    return call;
}

bool PendingCallRegistry::contains(CommandHandle handle) const {
    std::lock_guard lock(mutex_);
    return calls_.contains(handle);
}

size_t PendingCallRegistry::size() const {
    std::lock_guard lock(mutex_);
    return calls_.size();
}

bool PendingCallRegistry::wait_until_empty(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return emptied_.wait_for(lock, timeout, [this] { return calls_.empty(); });
}

} // namespace callbridge
