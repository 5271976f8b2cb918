#include "settings.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace codesync {

namespace fs = std::filesystem;
using json = nlohmann::json;

json Settings::to_json() const {
    return json{
        {"turbopuffer_region", turbopuffer_region},
        {"embedding_provider", embedding_provider},
        {"embedding_model", embedding_model},
        {"embedding_concurrency", embedding_concurrency},
        {"store_concurrency", store_concurrency},
        {"request_timeout_ms", request_timeout_ms}
    };
}

Settings Settings::from_json(const json& j) {
    Settings s;
    s.turbopuffer_region = j.value("turbopuffer_region", s.turbopuffer_region);
    s.embedding_provider = j.value("embedding_provider", s.embedding_provider);
    s.embedding_model = j.value("embedding_model", s.embedding_model);
    s.embedding_concurrency = j.value("embedding_concurrency", s.embedding_concurrency);
    s.store_concurrency = j.value("store_concurrency", s.store_concurrency);
    s.request_timeout_ms = j.value("request_timeout_ms", s.request_timeout_ms);
    s.normalize();
    return s;
}

void Settings::normalize() {
    if (embedding_concurrency > kMaxEmbeddingConcurrency) {
        spdlog::warn("⚠️ embedding_concurrency {} capped at {}", embedding_concurrency, kMaxEmbeddingConcurrency);
        embedding_concurrency = kMaxEmbeddingConcurrency;
    }
    embedding_concurrency = std::max(embedding_concurrency, 1);
    store_concurrency = std::max(store_concurrency, 1);
    if (request_timeout_ms <= 0) request_timeout_ms = 60000;
}

fs::path Settings::config_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "codesync" / "config.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".config" / "codesync" / "config.json";
    }
    throw ConfigError("Neither XDG_CONFIG_HOME nor HOME is set");
}

Settings Settings::load(const fs::path& path) {
    if (!fs::exists(path)) return Settings();
    try {
        std::ifstream f(path);
        return from_json(json::parse(f));
    } catch (const std::exception& e) {
        spdlog::error("❌ Settings corrupted at {}: {} (using defaults)", path.string(), e.what());
        return Settings();
    }
}

Settings Settings::load_or_init(const fs::path& path, const std::function<std::string()>& discover_region) {
    if (fs::exists(path)) return load(path);

    Settings settings;
    if (discover_region) {
        settings.turbopuffer_region = discover_region();
    }
    try {
        settings.save(path);
        spdlog::info("⚙️  Settings initialized at {} (region {})", path.string(), settings.turbopuffer_region);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Could not write settings to {}: {}", path.string(), e.what());
    }
    return settings;
}

void Settings::save(const fs::path& path) const {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) throw IOError("cannot create " + path.parent_path().string() + ": " + ec.message());

    std::ofstream f(path);
    if (!f.is_open()) throw IOError("cannot write " + path.string());
    f << to_json().dump(2);
}

} // namespace codesync
