/**
 * @file pool.h
 * @brief Typed façade over the native pool-ledger operations.
 *
 * Each operation comes in three forms sharing one argument list:
 *
 * - op(args...)                    blocks until the completion arrives
 * - op_timeout(args..., timeout)   blocks at most timeout (<= 0 polls once)
 * - op_async(args..., callback)    returns the immediate status; on Success
 *                                  callback runs once on a native thread
 *
 * Example:
 * @code
 *   auto library = NativeLibrary::load();
 *   auto pool = Pool::create(library->pool_api());
 *
 *   auto created = pool->create_ledger_config("sandbox", R"({"genesis_txn":"/tmp/pool.txn"})");
 *   auto handle = pool->open_ledger("sandbox", std::nullopt);
 *   if (handle) {
 *       (void)pool->close(*handle);
 *   }
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <callbridge/error.h>
#include <callbridge/native_api.h>
#include <callbridge/result_shapes.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace callbridge {

using PoolHandle = callbridge_pool_handle_t;
using Timeout = std::chrono::nanoseconds;

using EmptyCallback = EmptyResult::continuation_type;
using PoolHandleCallback = HandleResult::continuation_type;
using StringCallback = StringResult::continuation_type;

class Pool {
public:
    /**
     * @brief Bind a pool symbol table.
     *
     * @return InvalidConfig if any function pointer in api is NULL
     */
    [[nodiscard]] static Result<Pool> create(const callbridge_pool_api_t& api);

    // ─────────────────────────────────────────────────────────────────────────
    // Ledger configs
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Create a named pool ledger configuration.
     *
     * @param name Config name (non-empty)
     * @param config JSON object with "genesis_txn" naming the genesis file
     */
    [[nodiscard]] Result<void> create_ledger_config(const std::string& name,
                                                    const std::string& config) const;
    [[nodiscard]] Result<void> create_ledger_config_timeout(const std::string& name,
                                                            const std::string& config,
                                                            Timeout timeout) const;
    [[nodiscard]] ErrorCode create_ledger_config_async(const std::string& name,
                                                       const std::string& config,
                                                       EmptyCallback callback) const;

    [[nodiscard]] Result<void> delete_config(const std::string& name) const;
    [[nodiscard]] Result<void> delete_config_timeout(const std::string& name, Timeout timeout) const;
    [[nodiscard]] ErrorCode delete_config_async(const std::string& name, EmptyCallback callback) const;

    /**
     * @brief List created configs as the native JSON array.
     */
    [[nodiscard]] Result<std::string> list() const;
    [[nodiscard]] Result<std::string> list_timeout(Timeout timeout) const;
    [[nodiscard]] ErrorCode list_async(StringCallback callback) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Pool connections
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Open a pool ledger created by create_ledger_config().
     *
     * @param config Runtime config JSON, or nullopt for library defaults
     * @return Handle of the opened pool
     */
    [[nodiscard]] Result<PoolHandle> open_ledger(const std::string& name,
                                                 const std::optional<std::string>& config) const;
    [[nodiscard]] Result<PoolHandle> open_ledger_timeout(const std::string& name,
                                                         const std::optional<std::string>& config,
                                                         Timeout timeout) const;
    [[nodiscard]] ErrorCode open_ledger_async(const std::string& name,
                                              const std::optional<std::string>& config,
                                              PoolHandleCallback callback) const;

    [[nodiscard]] Result<void> refresh(PoolHandle pool) const;
    [[nodiscard]] Result<void> refresh_timeout(PoolHandle pool, Timeout timeout) const;
    [[nodiscard]] ErrorCode refresh_async(PoolHandle pool, EmptyCallback callback) const;

    [[nodiscard]] Result<void> close(PoolHandle pool) const;
    [[nodiscard]] Result<void> close_timeout(PoolHandle pool, Timeout timeout) const;
    [[nodiscard]] ErrorCode close_async(PoolHandle pool, EmptyCallback callback) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Protocol
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Set the node protocol version used by subsequent requests.
     */
    [[nodiscard]] Result<void> set_protocol_version(size_t version) const;
    [[nodiscard]] Result<void> set_protocol_version_timeout(size_t version, Timeout timeout) const;
    [[nodiscard]] ErrorCode set_protocol_version_async(size_t version, EmptyCallback callback) const;

private:
    explicit Pool(const callbridge_pool_api_t& api) noexcept : api_(api) {}

    callbridge_pool_api_t api_;
};

} // namespace callbridge
