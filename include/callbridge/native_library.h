/**
 * @file native_library.h
 * @brief Runtime binding of the native pool library.
 *
 * Loads the shared library with dlopen and resolves every pool operation
 * into a callbridge_pool_api_t. The library stays mapped for the lifetime
 * of the NativeLibrary object; drain the bridge before destroying it.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <callbridge/config.h>
#include <callbridge/error.h>
#include <callbridge/native_api.h>

#include <string>

namespace callbridge {

class NativeLibrary {
public:
    /**
     * @brief Soname looked up when no path is configured.
     */
    [[nodiscard]] static constexpr const char* default_path() noexcept {
        return "libindy.so";
    }

    /**
     * @brief Load a library and resolve all pool symbols.
     *
     * @return NativeLibraryNotFound if dlopen fails,
     *         NativeSymbolMissing if any pool symbol is absent
     */
    [[nodiscard]] static Result<NativeLibrary> load(const std::string& path = default_path());

    /**
     * @brief Load the library named by config.native_library_path.
     */
    [[nodiscard]] static Result<NativeLibrary> load(const BridgeConfig& config);

    ~NativeLibrary();

    NativeLibrary(const NativeLibrary&) = delete;
    NativeLibrary& operator=(const NativeLibrary&) = delete;

    NativeLibrary(NativeLibrary&& other) noexcept;
    NativeLibrary& operator=(NativeLibrary&& other) noexcept;

    [[nodiscard]] const callbridge_pool_api_t& pool_api() const noexcept { return api_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    NativeLibrary(void* handle, std::string path, const callbridge_pool_api_t& api) noexcept;

    void reset() noexcept;

    void* handle_ = nullptr;
    std::string path_;
    callbridge_pool_api_t api_{};
};

} // namespace callbridge
