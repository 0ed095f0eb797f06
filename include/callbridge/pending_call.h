/**
 * @file pending_call.h
 * @brief The two delivery targets a registered call can have.
 *
 * A ChannelSender fulfils a one-shot promise that a blocking waiter holds
 * the future of. A UserClosure runs a caller-supplied continuation on the
 * native callback thread. Either kind exists for every ResultShape, and a
 * PendingCall is exactly one of the eight.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <callbridge/result_shapes.h>

#include <future>
#include <type_traits>
#include <utility>
#include <variant>

namespace callbridge {

template<typename Shape>
struct ChannelSender {
    using shape_type = Shape;
    using outcome_type = Outcome<typename Shape::value_type>;

    std::promise<outcome_type> promise;
};

template<typename Shape>
struct UserClosure {
    using shape_type = Shape;

    typename Shape::continuation_type continuation;
};

using PendingCall = std::variant<
    ChannelSender<EmptyResult>,
    ChannelSender<HandleResult>,
    ChannelSender<StringResult>,
    ChannelSender<BytesResult>,
    UserClosure<EmptyResult>,
    UserClosure<HandleResult>,
    UserClosure<StringResult>,
    UserClosure<BytesResult>
>;

/**
 * @brief Shape of the completion a pending call expects.
 */
[[nodiscard]] inline ResultShape shape_of(const PendingCall& call) noexcept {
    return std::visit([](const auto& target) {
        return std::decay_t<decltype(target)>::shape_type::shape;
    }, call);
}

/**
 * @brief "channel" or "closure", for diagnostics.
 */
[[nodiscard]] inline const char* kind_of(const PendingCall& call) noexcept {
    return call.index() < 4 ? "channel" : "closure";
}

} // namespace callbridge
