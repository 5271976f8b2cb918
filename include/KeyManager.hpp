#pragma once
#include <cstdlib>
#include <shared_mutex>
#include <string>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace codesync {

// Credentials for the remote services, read from the environment once.
class KeyManager {
private:
    std::string voyage_key;
    std::string turbopuffer_key;
    mutable std::shared_mutex pool_mutex;

    static std::string read_env(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string();
    }

public:
    static constexpr const char* kVoyageEnv = "VOYAGE_API_KEY";
    static constexpr const char* kTurbopufferEnv = "TURBOPUFFER_API_KEY";

    KeyManager() {
        refresh();
    }

    KeyManager(std::string voyage, std::string turbopuffer)
        : voyage_key(std::move(voyage)), turbopuffer_key(std::move(turbopuffer)) {}

    void refresh() {
        std::unique_lock lock(pool_mutex);
        voyage_key = read_env(kVoyageEnv);
        turbopuffer_key = read_env(kTurbopufferEnv);
        spdlog::debug("🔑 Keys: voyage {}, turbopuffer {}",
                      voyage_key.empty() ? "MISSING" : "READY",
                      turbopuffer_key.empty() ? "MISSING" : "READY");
    }

    std::string require_voyage_key() const {
        std::shared_lock lock(pool_mutex);
        if (voyage_key.empty()) {
            throw ConfigError(std::string(kVoyageEnv) + " is not set");
        }
        return voyage_key;
    }

    std::string require_turbopuffer_key() const {
        std::shared_lock lock(pool_mutex);
        if (turbopuffer_key.empty()) {
            throw ConfigError(std::string(kTurbopufferEnv) + " is not set");
        }
        return turbopuffer_key;
    }
};

} // namespace codesync
