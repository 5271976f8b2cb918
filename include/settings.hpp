#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace codesync {

// Global, per-user settings (~/.config/codesync/config.json).
struct Settings {
    static constexpr const char* kDefaultRegion = "gcp-us-east4";
    static constexpr int kMaxEmbeddingConcurrency = 3;

    std::string turbopuffer_region = kDefaultRegion;
    std::string embedding_provider = "voyage";
    std::string embedding_model = "voyage-code-3";
    int embedding_concurrency = 3;
    int store_concurrency = 4;
    long request_timeout_ms = 60000;

    nlohmann::json to_json() const;
    static Settings from_json(const nlohmann::json& j);

    // $XDG_CONFIG_HOME/codesync/config.json, else ~/.config/codesync/config.json.
    static std::filesystem::path config_path();

    // Missing keys take defaults; a corrupt file is logged and ignored.
    static Settings load(const std::filesystem::path& path);

    // Loads the file; when it does not exist yet, asks `discover_region` for
    // the region and writes the file.
    static Settings load_or_init(const std::filesystem::path& path,
                                 const std::function<std::string()>& discover_region);

    void save(const std::filesystem::path& path) const;

    // Clamps concurrency values into their supported ranges.
    void normalize();
};

} // namespace codesync
