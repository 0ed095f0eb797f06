/**
 * @file fake_pool_library.cpp
 * @brief FakePoolLibrary implementation.
 */

#include "fake_pool_library.h"

#include <cctype>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <utility>

namespace callbridge::testing {

namespace {

std::atomic<FakePoolLibrary*> g_current{nullptr};

bool is_blank(const char* text) {
    return text == nullptr || *text == '\0';
}

char first_significant_char(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return c;
        }
    }
    return '\0';
}

/**
 * @brief Extract a top-level string member from a flat JSON object.
 */
std::optional<std::string> json_string_member(const std::string& json, const std::string& key) {
    const std::string quoted = "\"" + key + "\"";
    size_t pos = json.find(quoted);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos = json.find(':', pos + quoted.size());
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    size_t open = json.find('"', pos + 1);
    if (open == std::string::npos) {
        return std::nullopt;
    }
    size_t close = json.find('"', open + 1);
    if (close == std::string::npos) {
        return std::nullopt;
    }
    return json.substr(open + 1, close - open - 1);
}

// ─────────────────────────────────────────────────────────────────────────────
// C trampolines
// ─────────────────────────────────────────────────────────────────────────────

callbridge_error_t fake_create_pool_ledger_config(callbridge_command_handle_t handle,
                                                  const char* name,
                                                  const char* config,
                                                  callbridge_empty_cb cb) {
    FakePoolLibrary* library = g_current.load();
    return library ? library->create_pool_ledger_config(handle, name, config, cb)
                   : CALLBRIDGE_ERR_COMMON_INVALID_STATE;
}

callbridge_error_t fake_open_pool_ledger(callbridge_command_handle_t handle,
                                         const char* name,
                                         const char* config,
                                         callbridge_handle_cb cb) {
    FakePoolLibrary* library = g_current.load();
    return library ? library->open_pool_ledger(handle, name, config, cb)
                   : CALLBRIDGE_ERR_COMMON_INVALID_STATE;
}

callbridge_error_t fake_refresh_pool_ledger(callbridge_command_handle_t handle,
                                            callbridge_pool_handle_t pool,
                                            callbridge_empty_cb cb) {
    FakePoolLibrary* library = g_current.load();
    return library ? library->refresh_pool_ledger(handle, pool, cb)
                   : CALLBRIDGE_ERR_COMMON_INVALID_STATE;
}

callbridge_error_t fake_list_pools(callbridge_command_handle_t handle, callbridge_string_cb cb) {
    FakePoolLibrary* library = g_current.load();
    return library ? library->list_pools(handle, cb) : CALLBRIDGE_ERR_COMMON_INVALID_STATE;
}

callbridge_error_t fake_close_pool_ledger(callbridge_command_handle_t handle,
                                          callbridge_pool_handle_t pool,
                                          callbridge_empty_cb cb) {
    FakePoolLibrary* library = g_current.load();
    return library ? library->close_pool_ledger(handle, pool, cb)
                   : CALLBRIDGE_ERR_COMMON_INVALID_STATE;
}

callbridge_error_t fake_delete_pool_ledger_config(callbridge_command_handle_t handle,
                                                  const char* name,
                                                  callbridge_empty_cb cb) {
    FakePoolLibrary* library = g_current.load();
    return library ? library->delete_pool_ledger_config(handle, name, cb)
                   : CALLBRIDGE_ERR_COMMON_INVALID_STATE;
}

callbridge_error_t fake_set_protocol_version(callbridge_command_handle_t handle,
                                             size_t version,
                                             callbridge_empty_cb cb) {
    FakePoolLibrary* library = g_current.load();
    return library ? library->set_protocol_version(handle, version, cb)
                   : CALLBRIDGE_ERR_COMMON_INVALID_STATE;
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

FakePoolLibrary::FakePoolLibrary()
    : FakePoolLibrary(Options{})
{}

FakePoolLibrary::FakePoolLibrary(Options options)
    : options_(options)
    , latency_ms_(options.latency.count())
{
    size_t count = options_.workers == 0 ? 1 : options_.workers;
    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
    g_current.store(this);
}

FakePoolLibrary::~FakePoolLibrary() {
    FakePoolLibrary* self = this;
    g_current.compare_exchange_strong(self, nullptr);

    {
        std::lock_guard lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

callbridge_pool_api_t FakePoolLibrary::api() noexcept {
    callbridge_pool_api_t api{};
    api.create_pool_ledger_config = &fake_create_pool_ledger_config;
    api.open_pool_ledger = &fake_open_pool_ledger;
    api.refresh_pool_ledger = &fake_refresh_pool_ledger;
    api.list_pools = &fake_list_pools;
    api.close_pool_ledger = &fake_close_pool_ledger;
    api.delete_pool_ledger_config = &fake_delete_pool_ledger_config;
    api.set_protocol_version = &fake_set_protocol_version;
    return api;
}

// ─────────────────────────────────────────────────────────────────────────────
// Worker pool
// ─────────────────────────────────────────────────────────────────────────────

void FakePoolLibrary::schedule(std::function<void()> job) {
    {
        std::lock_guard lock(queue_mutex_);
        queue_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
}

void FakePoolLibrary::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // Pending jobs still run during shutdown so no caller waits forever
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
            ++running_;
        }

        std::this_thread::sleep_for(
            std::chrono::milliseconds(latency_ms_.load(std::memory_order_relaxed)));
        job();

        {
            std::lock_guard lock(queue_mutex_);
            --running_;
        }
        idle_cv_.notify_all();
    }
}

void FakePoolLibrary::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && running_ == 0; });
}

callbridge_error_t FakePoolLibrary::reject(callbridge_command_handle_t /*handle*/,
                                           callbridge_error_t status,
                                           const std::function<void(callbridge_error_t)>& fire) {
    if (options_.complete_rejected_calls) {
        fire(status);
    }
    return status;
}

// ─────────────────────────────────────────────────────────────────────────────
// Operations
// ─────────────────────────────────────────────────────────────────────────────

callbridge_error_t FakePoolLibrary::create_pool_ledger_config(callbridge_command_handle_t handle,
                                                              const char* name,
                                                              const char* config,
                                                              callbridge_empty_cb cb) {
    auto fire = [this, handle, cb](callbridge_error_t status) {
        completions_.fetch_add(1, std::memory_order_acq_rel);
        cb(handle, status);
    };

    if (is_blank(name)) {
        return reject(handle, CALLBRIDGE_ERR_COMMON_INVALID_PARAM2, fire);
    }
    if (config == nullptr) {
        return reject(handle, CALLBRIDGE_ERR_COMMON_INVALID_PARAM3, fire);
    }

    std::string config_json(config);
    auto genesis = json_string_member(config_json, "genesis_txn");
    if (first_significant_char(config_json) != '{' || !genesis) {
        return reject(handle, CALLBRIDGE_ERR_COMMON_INVALID_STRUCTURE, fire);
    }

    schedule([this, fire, pool_name = std::string(name), path = *genesis] {
        std::ifstream file(path);
        if (!file) {
            fire(CALLBRIDGE_ERR_COMMON_IO);
            return;
        }
        std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
        if (first_significant_char(contents) != '{') {
            fire(CALLBRIDGE_ERR_COMMON_INVALID_STRUCTURE);
            return;
        }

        callbridge_error_t status = CALLBRIDGE_OK;
        {
            std::lock_guard lock(state_mutex_);
            if (!configs_.try_emplace(pool_name, path).second) {
                status = CALLBRIDGE_ERR_POOL_CONFIG_ALREADY_EXISTS;
            }
        }
        fire(status);
    });
    return CALLBRIDGE_OK;
}

callbridge_error_t FakePoolLibrary::open_pool_ledger(callbridge_command_handle_t handle,
                                                     const char* name,
                                                     const char* config,
                                                     callbridge_handle_cb cb) {
    auto fire = [this, handle, cb](callbridge_error_t status, callbridge_pool_handle_t pool = 0) {
        completions_.fetch_add(1, std::memory_order_acq_rel);
        cb(handle, status, pool);
    };

    if (is_blank(name)) {
        return reject(handle, CALLBRIDGE_ERR_COMMON_INVALID_PARAM2,
                      [&fire](callbridge_error_t status) { fire(status); });
    }
    if (config != nullptr && first_significant_char(config) != '{') {
        return reject(handle, CALLBRIDGE_ERR_COMMON_INVALID_STRUCTURE,
                      [&fire](callbridge_error_t status) { fire(status); });
    }

    schedule([this, fire, pool_name = std::string(name)] {
        callbridge_error_t status = CALLBRIDGE_OK;
        callbridge_pool_handle_t pool = 0;
        {
            std::lock_guard lock(state_mutex_);
            if (!configs_.contains(pool_name)) {
                status = CALLBRIDGE_ERR_POOL_LEDGER_NOT_CREATED;
            } else {
                for (const auto& [open_handle, open_name] : open_pools_) {
                    if (open_name == pool_name) {
                        status = CALLBRIDGE_ERR_COMMON_INVALID_STATE;
                        break;
                    }
                }
                if (status == CALLBRIDGE_OK) {
                    pool = next_pool_handle_++;
                    open_pools_.emplace(pool, pool_name);
                }
            }
        }
        fire(status, pool);
    });
    return CALLBRIDGE_OK;
}

callbridge_error_t FakePoolLibrary::refresh_pool_ledger(callbridge_command_handle_t handle,
                                                        callbridge_pool_handle_t pool,
                                                        callbridge_empty_cb cb) {
    schedule([this, handle, pool, cb] {
        callbridge_error_t status = is_open(pool) ? CALLBRIDGE_OK
                                                  : CALLBRIDGE_ERR_POOL_LEDGER_INVALID_HANDLE;
        completions_.fetch_add(1, std::memory_order_acq_rel);
        cb(handle, status);
    });
    return CALLBRIDGE_OK;
}

callbridge_error_t FakePoolLibrary::list_pools(callbridge_command_handle_t handle,
                                               callbridge_string_cb cb) {
    schedule([this, handle, cb] {
        std::ostringstream json;
        json << '[';
        {
            std::lock_guard lock(state_mutex_);
            bool first = true;
            for (const auto& [name, path] : configs_) {
                if (!first) {
                    json << ',';
                }
                json << "{\"pool\":\"" << name << "\"}";
                first = false;
            }
        }
        json << ']';

        const std::string pools = json.str();
        completions_.fetch_add(1, std::memory_order_acq_rel);
        cb(handle, CALLBRIDGE_OK, pools.c_str());
    });
    return CALLBRIDGE_OK;
}

callbridge_error_t FakePoolLibrary::close_pool_ledger(callbridge_command_handle_t handle,
                                                      callbridge_pool_handle_t pool,
                                                      callbridge_empty_cb cb) {
    schedule([this, handle, pool, cb] {
        callbridge_error_t status = CALLBRIDGE_OK;
        {
            std::lock_guard lock(state_mutex_);
            if (open_pools_.erase(pool) == 0) {
                status = CALLBRIDGE_ERR_POOL_LEDGER_INVALID_HANDLE;
            }
        }
        completions_.fetch_add(1, std::memory_order_acq_rel);
        cb(handle, status);
    });
    return CALLBRIDGE_OK;
}

callbridge_error_t FakePoolLibrary::delete_pool_ledger_config(callbridge_command_handle_t handle,
                                                              const char* name,
                                                              callbridge_empty_cb cb) {
    auto fire = [this, handle, cb](callbridge_error_t status) {
        completions_.fetch_add(1, std::memory_order_acq_rel);
        cb(handle, status);
    };

    if (is_blank(name)) {
        return reject(handle, CALLBRIDGE_ERR_COMMON_INVALID_PARAM2, fire);
    }

    schedule([this, fire, pool_name = std::string(name)] {
        callbridge_error_t status = CALLBRIDGE_OK;
        {
            std::lock_guard lock(state_mutex_);
            bool opened = false;
            for (const auto& [open_handle, open_name] : open_pools_) {
                opened = opened || open_name == pool_name;
            }
            if (opened) {
                status = CALLBRIDGE_ERR_COMMON_INVALID_STATE;
            } else if (configs_.erase(pool_name) == 0) {
                status = CALLBRIDGE_ERR_COMMON_IO;
            }
        }
        fire(status);
    });
    return CALLBRIDGE_OK;
}

callbridge_error_t FakePoolLibrary::set_protocol_version(callbridge_command_handle_t handle,
                                                         size_t version,
                                                         callbridge_empty_cb cb) {
    schedule([this, handle, version, cb] {
        callbridge_error_t status = CALLBRIDGE_OK;
        if (version == 1 || version == 2) {
            std::lock_guard lock(state_mutex_);
            protocol_version_ = version;
        } else {
            status = CALLBRIDGE_ERR_POOL_INCOMPATIBLE_PROTOCOL;
        }
        completions_.fetch_add(1, std::memory_order_acq_rel);
        cb(handle, status);
    });
    return CALLBRIDGE_OK;
}

// ─────────────────────────────────────────────────────────────────────────────
// Inspection
// ─────────────────────────────────────────────────────────────────────────────

bool FakePoolLibrary::has_config(const std::string& name) const {
    std::lock_guard lock(state_mutex_);
    return configs_.contains(name);
}

bool FakePoolLibrary::is_open(callbridge_pool_handle_t pool) const {
    std::lock_guard lock(state_mutex_);
    return open_pools_.contains(pool);
}

size_t FakePoolLibrary::protocol_version() const {
    std::lock_guard lock(state_mutex_);
    return protocol_version_;
}

} // namespace callbridge::testing
