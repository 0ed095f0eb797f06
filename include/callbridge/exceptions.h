/**
 * @file exceptions.h
 * @brief Exception hierarchy for bridge contract breaches.
 *
 * These exceptions represent programming errors that cannot be handled
 * through normal control flow. They are only ever thrown on a caller
 * thread; dispatch adapters running on native threads report through
 * the protocol-violation handler instead (see dispatch.h).
 */

#pragma once

#include <callbridge/native_api.h>

#include <stdexcept>
#include <string>
#include <cstdint>

namespace callbridge {

/**
 * @brief Base class for all callbridge exceptions.
 */
class BridgeException : public std::runtime_error {
public:
    explicit BridgeException(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief The bridge's own invariant was broken.
 *
 * Thrown when:
 * - A command handle is registered twice
 * - A synchronously rejected call has already been completed by the
 *   native side (its pending entry is gone)
 */
class ProtocolViolationError : public BridgeException {
public:
    ProtocolViolationError(callbridge_command_handle_t handle, const std::string& msg)
        : BridgeException("Protocol violation for command handle " +
                          std::to_string(handle) + ": " + msg)
        , command_handle_(handle)
    {}

    [[nodiscard]] callbridge_command_handle_t command_handle() const noexcept {
        return command_handle_;
    }

private:
    callbridge_command_handle_t command_handle_;
};

} // namespace callbridge
