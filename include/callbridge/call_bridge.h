/**
 * @file call_bridge.h
 * @brief Correlates native calls with their asynchronous completions.
 *
 * Every wrapped operation goes through one primitive, submit():
 *
 *   1. issue a fresh command handle
 *   2. register the delivery target under it
 *   3. invoke the native function with the handle and the matching adapter
 *   4. on a non-zero immediate status, take the registration back out
 *
 * Registration always happens before the native call, so a completion
 * that fires on another thread before the native function even returns
 * still finds its waiter. The three public forms only differ in the
 * delivery target and in how long the caller waits:
 *
 * | Form           | Target        | Caller waits                        |
 * |----------------|---------------|-------------------------------------|
 * | call()         | ChannelSender | until the completion arrives        |
 * | call_timeout() | ChannelSender | at most the given duration          |
 * | call_async()   | UserClosure   | not at all                          |
 *
 * The bridge is process-wide because the native callback carries nothing
 * but the command handle; the adapters find the waiter through global().
 *
 * Thread-safety: all members may be called concurrently from any thread.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <callbridge/config.h>
#include <callbridge/dispatch.h>
#include <callbridge/error.h>
#include <callbridge/exceptions.h>
#include <callbridge/gsl.hpp>
#include <callbridge/handle_allocator.h>
#include <callbridge/logging.h>
#include <callbridge/pending_call.h>
#include <callbridge/pending_call_registry.h>
#include <callbridge/result_shapes.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <string>
#include <utility>

namespace callbridge {

class CallBridge {
public:
    /**
     * @brief The process-wide bridge the dispatch adapters route through.
     */
    [[nodiscard]] static CallBridge& global() noexcept;

    CallBridge(const CallBridge&) = delete;
    CallBridge& operator=(const CallBridge&) = delete;
    CallBridge(CallBridge&&) = delete;
    CallBridge& operator=(CallBridge&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Calls
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Invoke a native operation and block until it completes.
     *
     * @tparam Shape One of EmptyResult, HandleResult, StringResult, BytesResult
     * @param invoke Callable (CommandHandle, Shape::native_callback) -> native status
     * @return The completion value, or the immediate/delivered failure status
     * @throws ProtocolViolationError if the native side breaks the
     *         reject-or-complete contract
     */
    template<typename Shape, typename Invoke>
    [[nodiscard]] Result<typename Shape::value_type> call(Invoke&& invoke) {
        return call_blocking<Shape>(invoke, [](auto& future) {
            future.wait();
            return true;
        });
    }

    /**
     * @brief Like call(), but give up after timeout.
     *
     * A timeout of zero or less polls once without blocking. A timeout of
     * kUnboundedWait or more (including duration::max()) waits like call().
     * On expiry the call stays registered: the native operation still runs
     * to completion and its side effects persist, but the result is
     * discarded.
     *
     * @return WaitTimeout if no completion arrived in time
     */
    template<typename Shape, typename Invoke, typename Rep, typename Period>
    [[nodiscard]] Result<typename Shape::value_type> call_timeout(
        Invoke&& invoke, std::chrono::duration<Rep, Period> timeout) {
        using Duration = std::chrono::duration<Rep, Period>;
        const Duration budget = timeout > Duration::zero() ? timeout : Duration::zero();
        return call_blocking<Shape>(invoke, [budget](auto& future) {
            // wait_for adds the budget to steady_clock::now() in nanoseconds
            if (budget >= kUnboundedWait) {
                future.wait();
                return true;
            }
            return future.wait_for(budget) == std::future_status::ready;
        });
    }

    /// Timeouts at or above this are treated as "no deadline".
    static constexpr std::chrono::hours kUnboundedWait{24 * 365};

    /**
     * @brief Invoke a native operation and return without waiting.
     *
     * On Success the continuation runs exactly once, on the native callback
     * thread. On any other (immediate) status it never runs.
     *
     * @param continuation Must be non-empty
     * @return The native function's immediate status
     */
    template<typename Shape, typename Invoke>
    [[nodiscard]] ErrorCode call_async(Invoke&& invoke,
                                       typename Shape::continuation_type continuation) {
        gsl_Expects(static_cast<bool>(continuation));
        return submit<Shape>(UserClosure<Shape>{std::move(continuation)}, invoke).second;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Apply log level, violation handler and drain timeout.
     */
    void configure(const BridgeConfig& config);

    /**
     * @brief Wait for every outstanding call to complete.
     *
     * Call before unloading the native library or exiting, so no adapter
     * runs against torn-down state.
     *
     * @return WaitTimeout if calls were still pending when timeout expired
     */
    [[nodiscard]] Result<void> drain(std::chrono::milliseconds timeout);

    /**
     * @brief drain() with the configured drain timeout.
     */
    [[nodiscard]] Result<void> drain();

    [[nodiscard]] size_t pending_count() const { return registry_.size(); }

    [[nodiscard]] PendingCallRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] HandleAllocator& handles() noexcept { return handles_; }

private:
    static constexpr const char* kSubsystem = "bridge";

    CallBridge() = default;

    /**
     * @brief Register, invoke, and clean up after an immediate rejection.
     *
     * @return The issued handle and the native immediate status
     */
    template<typename Shape, typename Invoke>
    std::pair<CommandHandle, ErrorCode> submit(PendingCall target, Invoke& invoke) {
        const CommandHandle handle = handles_.next();
        registry_.insert(handle, std::move(target));

        ErrorCode status = ErrorCode::Success;
        try {
            status = from_native(static_cast<callbridge_error_t>(invoke(handle, Shape::adapter)));
        } catch (...) {
            (void)registry_.take(handle);
            throw;
        }

        if (status != ErrorCode::Success) {
            CALLBRIDGE_LOG_DEBUG(kSubsystem, "call %d rejected immediately with %s",
                                 handle, error_code_name(status));
            if (!registry_.take(handle)) {
                CALLBRIDGE_LOG_ERROR(kSubsystem, "call %d was rejected with %s but already completed",
                                     handle, error_code_name(status));
                throw ProtocolViolationError(handle, "rejected call was also completed");
            }
        }
        return {handle, status};
    }

    template<typename Shape, typename Invoke, typename Wait>
    Result<typename Shape::value_type> call_blocking(Invoke& invoke, Wait&& wait) {
        ChannelSender<Shape> sender;
        auto future = sender.promise.get_future();

        auto [handle, status] = submit<Shape>(std::move(sender), invoke);
        if (status != ErrorCode::Success) {
            return Err(Error::from_status(status));
        }

        if (!wait(future)) {
            CALLBRIDGE_LOG_WARN(kSubsystem, "call %d timed out; its completion will be discarded",
                                handle);
            return make_error(ErrorCode::WaitTimeout,
                              "call " + std::to_string(handle) + " did not complete in time");
        }

        typename ChannelSender<Shape>::outcome_type outcome;
        try {
            outcome = future.get();
        } catch (const std::future_error& e) {
            // Dropped by an adapter after a reported shape mismatch
            return make_error(ErrorCode::ProtocolViolation,
                              "call " + std::to_string(handle) + " lost its completion: " + e.what());
        }

        if (!outcome.succeeded()) {
            return Err(Error::from_status(outcome.status));
        }
        return Ok(std::move(*outcome.value));
    }

    HandleAllocator handles_;
    PendingCallRegistry registry_;
    std::atomic<std::chrono::milliseconds::rep> drain_timeout_ms_{5000};
};

} // namespace callbridge
