/**
 * @file config.h
 * @brief Bridge configuration and its fluent builder.
 *
 * The bridge itself has no tunables on the hot path; configuration covers
 * the ambient concerns around it: log verbosity, how long a shutdown drain
 * waits for outstanding completions, who hears about protocol violations,
 * and where the native library lives.
 */

#pragma once

#include <callbridge/dispatch.h>
#include <callbridge/error.h>
#include <callbridge/logging.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace callbridge {

/**
 * @brief Validated bridge configuration.
 *
 * Apply with CallBridge::configure().
 */
struct BridgeConfig {
    LogLevel log_level = LogLevel::Info;
    std::chrono::milliseconds drain_timeout{5000};

    /// NULL keeps the default: abort on violation
    callbridge_violation_handler violation_handler = nullptr;
    void* violation_userdata = nullptr;

    std::string native_library_path = "libindy.so";
};

/**
 * @brief Fluent builder for BridgeConfig.
 *
 * Example:
 * @code
 *   auto config = BridgeConfigBuilder()
 *       .with_log_level(LogLevel::Debug)
 *       .with_drain_timeout(std::chrono::seconds(2))
 *       .build();
 *
 *   if (config) {
 *       CallBridge::global().configure(*config);
 *   }
 * @endcode
 */
class BridgeConfigBuilder {
public:
    static constexpr std::chrono::milliseconds MaxDrainTimeout{10 * 60 * 1000};

    BridgeConfigBuilder() = default;

    BridgeConfigBuilder& with_log_level(LogLevel level) noexcept {
        config_.log_level = level;
        return *this;
    }

    /**
     * @brief How long CallBridge::drain() waits (0 to 10 minutes).
     */
    BridgeConfigBuilder& with_drain_timeout(std::chrono::milliseconds timeout) noexcept {
        config_.drain_timeout = timeout;
        return *this;
    }

    BridgeConfigBuilder& with_violation_handler(callbridge_violation_handler handler,
                                                void* userdata = nullptr) noexcept {
        config_.violation_handler = handler;
        config_.violation_userdata = userdata;
        return *this;
    }

    BridgeConfigBuilder& with_native_library(std::string path) {
        config_.native_library_path = std::move(path);
        return *this;
    }

    /**
     * @brief Validate and build configuration.
     *
     * @return Result with valid config or InvalidConfig error
     */
    [[nodiscard]] Result<BridgeConfig> build() {
        errors_.clear();

        int level = static_cast<int>(config_.log_level);
        if (level < CALLBRIDGE_LOG_ERROR || level > CALLBRIDGE_LOG_TRACE) {
            errors_.push_back("Log level out of range");
        }

        if (config_.drain_timeout.count() < 0) {
            errors_.push_back("Drain timeout cannot be negative");
        }
        if (config_.drain_timeout > MaxDrainTimeout) {
            errors_.push_back("Drain timeout cannot exceed 10 minutes");
        }

        if (config_.native_library_path.empty()) {
            errors_.push_back("Native library path cannot be empty");
        }

        if (!errors_.empty()) {
            std::string msg = "Configuration validation failed:";
            for (const auto& err : errors_) {
                msg += "\n  - " + err;
            }
            return Err(Error(ErrorCode::InvalidConfig, msg));
        }

        return Ok(config_);
    }

    /**
     * @brief Build or throw on error.
     *
     * @throws std::runtime_error if validation fails
     */
    [[nodiscard]] BridgeConfig build_or_throw() {
        auto result = build();
        if (!result.has_value()) {
            throw std::runtime_error(result.error().message());
        }
        return result.value();
    }

    /**
     * @brief Get validation errors from last build() call.
     */
    [[nodiscard]] const std::vector<std::string>& errors() const noexcept {
        return errors_;
    }

private:
    BridgeConfig config_;
    std::vector<std::string> errors_;
};

} // namespace callbridge
