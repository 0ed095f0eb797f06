/**
 * @file error.h
 * @brief Status codes, status categories and Result<T> for callbridge.
 *
 * Provides:
 * - ErrorCode mirroring the native status domain plus bridge-local codes
 * - StatusCategory, the closed classification used by callers
 * - Error struct with code, message, and source location
 * - Result<T> type alias for std::expected<T, Error>
 * - Ok(), Err(), make_error() helper functions
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <callbridge/native_api.h>

#include <expected>
#include <source_location>
#include <string>
#include <utility>
#include <cstdint>

namespace callbridge {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Status codes crossing the native boundary.
 *
 * Native values propagate verbatim; any integer the native library returns
 * is representable, including values not enumerated here.
 */
enum class ErrorCode : int32_t {
    Success = CALLBRIDGE_OK,

    // Common errors (100-199)
    CommonInvalidParam1 = CALLBRIDGE_ERR_COMMON_INVALID_PARAM1,
    CommonInvalidParam2 = CALLBRIDGE_ERR_COMMON_INVALID_PARAM2,
    CommonInvalidParam3 = CALLBRIDGE_ERR_COMMON_INVALID_PARAM3,
    CommonInvalidParam4 = CALLBRIDGE_ERR_COMMON_INVALID_PARAM4,
    CommonInvalidParam5 = CALLBRIDGE_ERR_COMMON_INVALID_PARAM5,
    CommonInvalidParam6 = CALLBRIDGE_ERR_COMMON_INVALID_PARAM6,
    CommonInvalidState = CALLBRIDGE_ERR_COMMON_INVALID_STATE,
    CommonInvalidStructure = CALLBRIDGE_ERR_COMMON_INVALID_STRUCTURE,
    CommonIOError = CALLBRIDGE_ERR_COMMON_IO,

    // Wallet errors (200-299)
    WalletInvalidHandle = CALLBRIDGE_ERR_WALLET_INVALID_HANDLE,
    WalletAlreadyExistsError = CALLBRIDGE_ERR_WALLET_ALREADY_EXISTS,
    WalletNotFoundError = CALLBRIDGE_ERR_WALLET_NOT_FOUND,

    // Pool and ledger errors (300-399)
    PoolLedgerNotCreatedError = CALLBRIDGE_ERR_POOL_LEDGER_NOT_CREATED,
    PoolLedgerInvalidPoolHandle = CALLBRIDGE_ERR_POOL_LEDGER_INVALID_HANDLE,
    PoolLedgerTerminated = CALLBRIDGE_ERR_POOL_LEDGER_TERMINATED,
    LedgerNoConsensusError = CALLBRIDGE_ERR_LEDGER_NO_CONSENSUS,
    LedgerInvalidTransaction = CALLBRIDGE_ERR_LEDGER_INVALID_TRANSACTION,
    LedgerSecurityError = CALLBRIDGE_ERR_LEDGER_SECURITY,
    PoolLedgerConfigAlreadyExistsError = CALLBRIDGE_ERR_POOL_CONFIG_ALREADY_EXISTS,
    PoolLedgerTimeout = CALLBRIDGE_ERR_POOL_LEDGER_TIMEOUT,
    PoolIncompatibleProtocolVersion = CALLBRIDGE_ERR_POOL_INCOMPATIBLE_PROTOCOL,
    LedgerNotFound = CALLBRIDGE_ERR_LEDGER_NOT_FOUND,

    // Bridge-local (1000-1099)
    WaitTimeout = CALLBRIDGE_ERR_WAIT_TIMEOUT,
    ProtocolViolation = CALLBRIDGE_ERR_PROTOCOL_VIOLATION,
    NativeLibraryNotFound = CALLBRIDGE_ERR_NATIVE_LIBRARY_NOT_FOUND,
    NativeSymbolMissing = CALLBRIDGE_ERR_NATIVE_SYMBOL_MISSING,
    InvalidConfig = CALLBRIDGE_ERR_INVALID_CONFIG,
};

/**
 * @brief Convert a raw native status to ErrorCode.
 */
[[nodiscard]] inline constexpr ErrorCode from_native(callbridge_error_t status) noexcept {
    return static_cast<ErrorCode>(status);
}

/**
 * @brief Convert ErrorCode back to the raw native status.
 */
[[nodiscard]] inline constexpr callbridge_error_t to_native(ErrorCode code) noexcept {
    return static_cast<callbridge_error_t>(code);
}

/**
 * @brief Convert ErrorCode to string representation.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::CommonInvalidParam1: return "CommonInvalidParam1";
        case ErrorCode::CommonInvalidParam2: return "CommonInvalidParam2";
        case ErrorCode::CommonInvalidParam3: return "CommonInvalidParam3";
        case ErrorCode::CommonInvalidParam4: return "CommonInvalidParam4";
        case ErrorCode::CommonInvalidParam5: return "CommonInvalidParam5";
        case ErrorCode::CommonInvalidParam6: return "CommonInvalidParam6";
        case ErrorCode::CommonInvalidState: return "CommonInvalidState";
        case ErrorCode::CommonInvalidStructure: return "CommonInvalidStructure";
        case ErrorCode::CommonIOError: return "CommonIOError";
        case ErrorCode::WalletInvalidHandle: return "WalletInvalidHandle";
        case ErrorCode::WalletAlreadyExistsError: return "WalletAlreadyExistsError";
        case ErrorCode::WalletNotFoundError: return "WalletNotFoundError";
        case ErrorCode::PoolLedgerNotCreatedError: return "PoolLedgerNotCreatedError";
        case ErrorCode::PoolLedgerInvalidPoolHandle: return "PoolLedgerInvalidPoolHandle";
        case ErrorCode::PoolLedgerTerminated: return "PoolLedgerTerminated";
        case ErrorCode::LedgerNoConsensusError: return "LedgerNoConsensusError";
        case ErrorCode::LedgerInvalidTransaction: return "LedgerInvalidTransaction";
        case ErrorCode::LedgerSecurityError: return "LedgerSecurityError";
        case ErrorCode::PoolLedgerConfigAlreadyExistsError: return "PoolLedgerConfigAlreadyExistsError";
        case ErrorCode::PoolLedgerTimeout: return "PoolLedgerTimeout";
        case ErrorCode::PoolIncompatibleProtocolVersion: return "PoolIncompatibleProtocolVersion";
        case ErrorCode::LedgerNotFound: return "LedgerNotFound";
        case ErrorCode::WaitTimeout: return "WaitTimeout";
        case ErrorCode::ProtocolViolation: return "ProtocolViolation";
        case ErrorCode::NativeLibraryNotFound: return "NativeLibraryNotFound";
        case ErrorCode::NativeSymbolMissing: return "NativeSymbolMissing";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Status Categories
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Closed classification of status codes.
 *
 * Unclassified covers integers the native library may return that this
 * build does not enumerate.
 */
enum class StatusCategory : uint8_t {
    Success,
    InputValidationFailure,
    AlreadyExists,
    NotFound,
    IOFailure,
    TimeoutExpired,
    InternalProtocolViolation,
    Unclassified
};

[[nodiscard]] inline constexpr const char* to_string(StatusCategory category) noexcept {
    switch (category) {
        case StatusCategory::Success:                   return "Success";
        case StatusCategory::InputValidationFailure:    return "InputValidationFailure";
        case StatusCategory::AlreadyExists:             return "AlreadyExists";
        case StatusCategory::NotFound:                  return "NotFound";
        case StatusCategory::IOFailure:                 return "IOFailure";
        case StatusCategory::TimeoutExpired:            return "TimeoutExpired";
        case StatusCategory::InternalProtocolViolation: return "InternalProtocolViolation";
        case StatusCategory::Unclassified:              return "Unclassified";
    }
    return "Unknown";
}

/**
 * @brief Classify a status code.
 *
 * PoolLedgerTimeout is a network timeout reported by the native side and is
 * classified as IOFailure; only WaitTimeout maps to TimeoutExpired.
 */
[[nodiscard]] inline constexpr StatusCategory category_of(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return StatusCategory::Success;

        case ErrorCode::CommonInvalidParam1:
        case ErrorCode::CommonInvalidParam2:
        case ErrorCode::CommonInvalidParam3:
        case ErrorCode::CommonInvalidParam4:
        case ErrorCode::CommonInvalidParam5:
        case ErrorCode::CommonInvalidParam6:
        case ErrorCode::CommonInvalidState:
        case ErrorCode::CommonInvalidStructure:
        case ErrorCode::LedgerInvalidTransaction:
        case ErrorCode::PoolIncompatibleProtocolVersion:
        case ErrorCode::InvalidConfig:
            return StatusCategory::InputValidationFailure;

        case ErrorCode::WalletAlreadyExistsError:
        case ErrorCode::PoolLedgerConfigAlreadyExistsError:
            return StatusCategory::AlreadyExists;

        case ErrorCode::WalletInvalidHandle:
        case ErrorCode::WalletNotFoundError:
        case ErrorCode::PoolLedgerNotCreatedError:
        case ErrorCode::PoolLedgerInvalidPoolHandle:
        case ErrorCode::LedgerNotFound:
        case ErrorCode::NativeLibraryNotFound:
        case ErrorCode::NativeSymbolMissing:
            return StatusCategory::NotFound;

        case ErrorCode::CommonIOError:
        case ErrorCode::PoolLedgerTerminated:
        case ErrorCode::LedgerNoConsensusError:
        case ErrorCode::LedgerSecurityError:
        case ErrorCode::PoolLedgerTimeout:
            return StatusCategory::IOFailure;

        case ErrorCode::WaitTimeout:
            return StatusCategory::TimeoutExpired;

        case ErrorCode::ProtocolViolation:
            return StatusCategory::InternalProtocolViolation;
    }
    return StatusCategory::Unclassified;
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Structured error with code, message, and source location.
 *
 * Used as the error type in Result<T> (std::expected<T, Error>).
 * For statuses delivered by the native library the location is the bridge
 * site that observed the status, not a location inside native code.
 */
class Error {
public:
    /**
     * @brief Construct an error with code and message.
     * @param code Status code
     * @param message Human-readable description
     * @param location Source location (auto-captured by default)
     */
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , message_(std::move(message))
        , location_(location)
    {}

    /**
     * @brief Create an error for a status reported by the native library.
     */
    [[nodiscard]] static Error from_status(
        ErrorCode code,
        std::source_location loc = std::source_location::current()
    ) {
        return Error{code, std::string("native call failed with ") + error_code_name(code), loc};
    }

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] StatusCategory category() const noexcept { return category_of(code_); }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }

    [[nodiscard]] const char* file() const noexcept { return location_.file_name(); }
    [[nodiscard]] uint_least32_t line() const noexcept { return location_.line(); }
    [[nodiscard]] const char* function() const noexcept { return location_.function_name(); }

    /**
     * @brief Format error for display/logging.
     * @return Formatted string: "CODE(value) at file:line (func): message"
     */
    [[nodiscard]] std::string format() const {
        std::string out = error_code_name(code_);
        out += '(';
        out += std::to_string(static_cast<int32_t>(code_));
        out += ") at ";
        out += location_.file_name();
        out += ':';
        out += std::to_string(location_.line());
        out += " (";
        out += location_.function_name();
        out += "): ";
        out += message_;
        return out;
    }

    /**
     * @brief Check if this is a specific error code.
     */
    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Result type for fallible operations.
 *
 * Example:
 * @code
 *   auto handle = pool.open_ledger("sandbox", std::nullopt);
 *   if (!handle) {
 *       if (handle.error().is(ErrorCode::PoolLedgerNotCreatedError)) { ... }
 *   }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

/**
 * @brief Create error with code and message.
 */
[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Return error if condition is false.
 *
 * Usage:
 *   CALLBRIDGE_CHECK(api.list_pools != nullptr, ErrorCode::NativeSymbolMissing, "list_pools");
 */
#define CALLBRIDGE_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::callbridge::make_error(code, msg); \
        } \
    } while (0)

} // namespace callbridge
