/**
 * @file pool.cpp
 * @brief Pool façade: binds native pool functions to the bridge.
 *
 * String arguments are handed to native code as borrowed pointers that
 * stay valid for the duration of the native call only.
 *
 * @copyright GPL-2.0-or-later
 */

#include <callbridge/pool.h>
#include <callbridge/call_bridge.h>
#include <callbridge/logging.h>

#include <utility>
#include <variant>

namespace callbridge {

namespace {

constexpr const char* kSubsystem = "pool";

Result<void> discard_value(Result<std::monostate> result) {
    if (!result) {
        return std::unexpected(std::move(result.error()));
    }
    return Ok();
}

const char* optional_c_str(const std::optional<std::string>& value) noexcept {
    return value ? value->c_str() : nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// Native invokers: (CommandHandle, callback) -> immediate status
// ─────────────────────────────────────────────────────────────────────────────

auto create_ledger_config_invoker(const callbridge_pool_api_t& api,
                                  const std::string& name,
                                  const std::string& config) {
    return [fn = api.create_pool_ledger_config, &name, &config](CommandHandle handle,
                                                                callbridge_empty_cb cb) {
        return fn(handle, name.c_str(), config.c_str(), cb);
    };
}

auto open_ledger_invoker(const callbridge_pool_api_t& api,
                         const std::string& name,
                         const std::optional<std::string>& config) {
    return [fn = api.open_pool_ledger, &name, &config](CommandHandle handle,
                                                       callbridge_handle_cb cb) {
        return fn(handle, name.c_str(), optional_c_str(config), cb);
    };
}

auto refresh_invoker(const callbridge_pool_api_t& api, PoolHandle pool) {
    return [fn = api.refresh_pool_ledger, pool](CommandHandle handle, callbridge_empty_cb cb) {
        return fn(handle, pool, cb);
    };
}

auto list_invoker(const callbridge_pool_api_t& api) {
    return [fn = api.list_pools](CommandHandle handle, callbridge_string_cb cb) {
        return fn(handle, cb);
    };
}

auto close_invoker(const callbridge_pool_api_t& api, PoolHandle pool) {
    return [fn = api.close_pool_ledger, pool](CommandHandle handle, callbridge_empty_cb cb) {
        return fn(handle, pool, cb);
    };
}

auto delete_config_invoker(const callbridge_pool_api_t& api, const std::string& name) {
    return [fn = api.delete_pool_ledger_config, &name](CommandHandle handle,
                                                       callbridge_empty_cb cb) {
        return fn(handle, name.c_str(), cb);
    };
}

auto set_protocol_version_invoker(const callbridge_pool_api_t& api, size_t version) {
    return [fn = api.set_protocol_version, version](CommandHandle handle, callbridge_empty_cb cb) {
        return fn(handle, version, cb);
    };
}

} // anonymous namespace

Result<Pool> Pool::create(const callbridge_pool_api_t& api) {
    CALLBRIDGE_CHECK(api.create_pool_ledger_config, ErrorCode::InvalidConfig,
                     "pool api is missing create_pool_ledger_config");
    CALLBRIDGE_CHECK(api.open_pool_ledger, ErrorCode::InvalidConfig,
                     "pool api is missing open_pool_ledger");
    CALLBRIDGE_CHECK(api.refresh_pool_ledger, ErrorCode::InvalidConfig,
                     "pool api is missing refresh_pool_ledger");
    CALLBRIDGE_CHECK(api.list_pools, ErrorCode::InvalidConfig,
                     "pool api is missing list_pools");
    CALLBRIDGE_CHECK(api.close_pool_ledger, ErrorCode::InvalidConfig,
                     "pool api is missing close_pool_ledger");
    CALLBRIDGE_CHECK(api.delete_pool_ledger_config, ErrorCode::InvalidConfig,
                     "pool api is missing delete_pool_ledger_config");
    CALLBRIDGE_CHECK(api.set_protocol_version, ErrorCode::InvalidConfig,
                     "pool api is missing set_protocol_version");

    CALLBRIDGE_LOG_DEBUG(kSubsystem, "pool api bound");
    return Pool(api);
}

// ─────────────────────────────────────────────────────────────────────────────
// create_ledger_config
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Pool::create_ledger_config(const std::string& name, const std::string& config) const {
    return discard_value(CallBridge::global().call<EmptyResult>(
        create_ledger_config_invoker(api_, name, config)));
}

Result<void> Pool::create_ledger_config_timeout(const std::string& name,
                                                const std::string& config,
                                                Timeout timeout) const {
    return discard_value(CallBridge::global().call_timeout<EmptyResult>(
        create_ledger_config_invoker(api_, name, config), timeout));
}

ErrorCode Pool::create_ledger_config_async(const std::string& name,
                                           const std::string& config,
                                           EmptyCallback callback) const {
    return CallBridge::global().call_async<EmptyResult>(
        create_ledger_config_invoker(api_, name, config), std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// delete_config
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Pool::delete_config(const std::string& name) const {
    return discard_value(CallBridge::global().call<EmptyResult>(
        delete_config_invoker(api_, name)));
}

Result<void> Pool::delete_config_timeout(const std::string& name, Timeout timeout) const {
    return discard_value(CallBridge::global().call_timeout<EmptyResult>(
        delete_config_invoker(api_, name), timeout));
}

ErrorCode Pool::delete_config_async(const std::string& name, EmptyCallback callback) const {
    return CallBridge::global().call_async<EmptyResult>(
        delete_config_invoker(api_, name), std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// list
// ─────────────────────────────────────────────────────────────────────────────

Result<std::string> Pool::list() const {
    return CallBridge::global().call<StringResult>(list_invoker(api_));
}

Result<std::string> Pool::list_timeout(Timeout timeout) const {
    return CallBridge::global().call_timeout<StringResult>(list_invoker(api_), timeout);
}

ErrorCode Pool::list_async(StringCallback callback) const {
    return CallBridge::global().call_async<StringResult>(list_invoker(api_), std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// open_ledger
// ─────────────────────────────────────────────────────────────────────────────

Result<PoolHandle> Pool::open_ledger(const std::string& name,
                                     const std::optional<std::string>& config) const {
    return CallBridge::global().call<HandleResult>(open_ledger_invoker(api_, name, config));
}

Result<PoolHandle> Pool::open_ledger_timeout(const std::string& name,
                                             const std::optional<std::string>& config,
                                             Timeout timeout) const {
    return CallBridge::global().call_timeout<HandleResult>(
        open_ledger_invoker(api_, name, config), timeout);
}

ErrorCode Pool::open_ledger_async(const std::string& name,
                                  const std::optional<std::string>& config,
                                  PoolHandleCallback callback) const {
    return CallBridge::global().call_async<HandleResult>(
        open_ledger_invoker(api_, name, config), std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// refresh / close
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Pool::refresh(PoolHandle pool) const {
    return discard_value(CallBridge::global().call<EmptyResult>(refresh_invoker(api_, pool)));
}

Result<void> Pool::refresh_timeout(PoolHandle pool, Timeout timeout) const {
    return discard_value(CallBridge::global().call_timeout<EmptyResult>(
        refresh_invoker(api_, pool), timeout));
}

ErrorCode Pool::refresh_async(PoolHandle pool, EmptyCallback callback) const {
    return CallBridge::global().call_async<EmptyResult>(refresh_invoker(api_, pool),
                                                        std::move(callback));
}

Result<void> Pool::close(PoolHandle pool) const {
    return discard_value(CallBridge::global().call<EmptyResult>(close_invoker(api_, pool)));
}

Result<void> Pool::close_timeout(PoolHandle pool, Timeout timeout) const {
    return discard_value(CallBridge::global().call_timeout<EmptyResult>(
        close_invoker(api_, pool), timeout));
}

ErrorCode Pool::close_async(PoolHandle pool, EmptyCallback callback) const {
    return CallBridge::global().call_async<EmptyResult>(close_invoker(api_, pool),
                                                        std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// set_protocol_version
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Pool::set_protocol_version(size_t version) const {
    return discard_value(CallBridge::global().call<EmptyResult>(
        set_protocol_version_invoker(api_, version)));
}

Result<void> Pool::set_protocol_version_timeout(size_t version, Timeout timeout) const {
    return discard_value(CallBridge::global().call_timeout<EmptyResult>(
        set_protocol_version_invoker(api_, version), timeout));
}

ErrorCode Pool::set_protocol_version_async(size_t version, EmptyCallback callback) const {
    return CallBridge::global().call_async<EmptyResult>(
        set_protocol_version_invoker(api_, version), std::move(callback));
}

} // namespace callbridge
