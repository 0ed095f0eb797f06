/**
 * @file native_library.cpp
 * @brief dlopen/dlsym binding of the native pool library.
 *
 * @copyright GPL-2.0-or-later
 */

#include <callbridge/native_library.h>
#include <callbridge/logging.h>

#include <dlfcn.h>

#include <utility>

namespace callbridge {

namespace {

constexpr const char* kSubsystem = "native";

std::string last_dl_error(const char* fallback) {
    const char* message = dlerror();
    return message ? message : fallback;
}

template<typename Fn>
Result<void> resolve(void* handle, const char* symbol, Fn& out) {
    dlerror();
    void* address = dlsym(handle, symbol);
    if (!address) {
        return make_error(ErrorCode::NativeSymbolMissing,
                          std::string("missing symbol: ") + symbol + " (" +
                          last_dl_error("not exported") + ")");
    }
    out = reinterpret_cast<Fn>(address);
    return Ok();
}

} // anonymous namespace

Result<NativeLibrary> NativeLibrary::load(const std::string& path) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        std::string reason = last_dl_error("dlopen failed");
        CALLBRIDGE_LOG_ERROR(kSubsystem, "cannot load %s: %s", path.c_str(), reason.c_str());
        return make_error(ErrorCode::NativeLibraryNotFound, reason + ": " + path);
    }

    callbridge_pool_api_t api{};
    Result<void> resolved = Ok();
    if (resolved) resolved = resolve(handle, CALLBRIDGE_SYM_CREATE_POOL_LEDGER_CONFIG, api.create_pool_ledger_config);
    if (resolved) resolved = resolve(handle, CALLBRIDGE_SYM_OPEN_POOL_LEDGER, api.open_pool_ledger);
    if (resolved) resolved = resolve(handle, CALLBRIDGE_SYM_REFRESH_POOL_LEDGER, api.refresh_pool_ledger);
    if (resolved) resolved = resolve(handle, CALLBRIDGE_SYM_LIST_POOLS, api.list_pools);
    if (resolved) resolved = resolve(handle, CALLBRIDGE_SYM_CLOSE_POOL_LEDGER, api.close_pool_ledger);
    if (resolved) resolved = resolve(handle, CALLBRIDGE_SYM_DELETE_POOL_LEDGER_CONFIG, api.delete_pool_ledger_config);
    if (resolved) resolved = resolve(handle, CALLBRIDGE_SYM_SET_PROTOCOL_VERSION, api.set_protocol_version);

    if (!resolved) {
        CALLBRIDGE_LOG_ERROR(kSubsystem, "%s: %s", path.c_str(), resolved.error().message().c_str());
        dlclose(handle);
        return std::unexpected(resolved.error());
    }

    CALLBRIDGE_LOG_INFO(kSubsystem, "loaded %s", path.c_str());
    return NativeLibrary(handle, path, api);
}

Result<NativeLibrary> NativeLibrary::load(const BridgeConfig& config) {
    return load(config.native_library_path);
}

NativeLibrary::NativeLibrary(void* handle, std::string path, const callbridge_pool_api_t& api) noexcept
    : handle_(handle)
    , path_(std::move(path))
    , api_(api)
{}

NativeLibrary::~NativeLibrary() {
    reset();
}

NativeLibrary::NativeLibrary(NativeLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr))
    , path_(std::move(other.path_))
    , api_(std::exchange(other.api_, callbridge_pool_api_t{}))
{}

NativeLibrary& NativeLibrary::operator=(NativeLibrary&& other) noexcept {
    if (this != &other) {
        reset();
        handle_ = std::exchange(other.handle_, nullptr);
        path_ = std::move(other.path_);
        api_ = std::exchange(other.api_, callbridge_pool_api_t{});
    }
    return *this;
}

void NativeLibrary::reset() noexcept {
    if (handle_) {
        if (dlclose(handle_) != 0) {
            const char* reason = dlerror();
            CALLBRIDGE_LOG_WARN(kSubsystem, "dlclose(%s) failed: %s", path_.c_str(),
                                reason ? reason : "unknown error");
        }
        handle_ = nullptr;
    }
    api_ = callbridge_pool_api_t{};
}

} // namespace callbridge
