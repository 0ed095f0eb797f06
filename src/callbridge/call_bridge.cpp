/**
 * @file call_bridge.cpp
 * @brief CallBridge lifecycle: the global instance, configuration, drain.
 *
 * @copyright GPL-2.0-or-later
 */

#include <callbridge/call_bridge.h>

namespace callbridge {

CallBridge& CallBridge::global() noexcept {
    // Never destroyed: adapters may still run on native threads during exit
    static CallBridge* instance = new CallBridge();
    return *instance;
}

void CallBridge::configure(const BridgeConfig& config) {
    callbridge_set_log_level(static_cast<callbridge_log_level>(config.log_level));
    callbridge_set_violation_handler(config.violation_handler, config.violation_userdata);
    drain_timeout_ms_.store(config.drain_timeout.count(), std::memory_order_relaxed);

    CALLBRIDGE_LOG_DEBUG(kSubsystem, "configured: log level %s, drain timeout %lld ms",
                         log_level_name(config.log_level),
                         static_cast<long long>(config.drain_timeout.count()));
}

Result<void> CallBridge::drain(std::chrono::milliseconds timeout) {
    if (registry_.wait_until_empty(timeout)) {
        return Ok();
    }

    const size_t remaining = registry_.size();
    CALLBRIDGE_LOG_WARN(kSubsystem, "drain gave up with %zu calls still pending", remaining);
    return make_error(ErrorCode::WaitTimeout,
                      std::to_string(remaining) + " calls still pending after drain");
}

Result<void> CallBridge::drain() {
    return drain(std::chrono::milliseconds(drain_timeout_ms_.load(std::memory_order_relaxed)));
}

} // namespace callbridge
