#include "chunk.hpp"
#include "hasher.hpp"

namespace codesync {

using json = nlohmann::json;

uint64_t ChunkKey::id() const {
    return xxhash64(to_string());
}

std::string ChunkKey::to_string() const {
    return path + ":" + std::to_string(start_line) + ":" + std::to_string(end_line);
}

size_t ChunkKeyHash::operator()(const ChunkKey& key) const noexcept {
    return static_cast<size_t>(key.id());
}

json Chunk::to_json() const {
    json j = {
        {"id", id()},
        {"path", path},
        {"start_line", start_line},
        {"end_line", end_line},
        {"language", language},
        {"content_hash", content_hash}
    };
    j["function_name"] = function_name ? json(*function_name) : json(nullptr);
    if (vector) j["vector"] = *vector;
    return j;
}

Chunk Chunk::from_json(const json& j) {
    Chunk chunk;
    chunk.path = j.value("path", "");
    chunk.start_line = j.value("start_line", 0u);
    chunk.end_line = j.value("end_line", 0u);
    chunk.language = j.value("language", "");
    chunk.content_hash = j.value("content_hash", uint64_t{0});

    if (j.contains("function_name") && j["function_name"].is_string()) {
        chunk.function_name = j["function_name"].get<std::string>();
    }
    if (j.contains("vector") && j["vector"].is_array()) {
        chunk.vector = j["vector"].get<std::vector<float>>();
    }
    if (j.contains("$dist") && j["$dist"].is_number()) {
        chunk.distance = j["$dist"].get<float>();
    }
    return chunk;
}

} // namespace codesync
