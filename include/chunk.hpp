#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace codesync {

// Identity of a chunk: where it lives, never what it contains.
struct ChunkKey {
    std::string path;
    uint32_t start_line = 0;
    uint32_t end_line = 0;

    bool operator==(const ChunkKey& other) const {
        return start_line == other.start_line && end_line == other.end_line && path == other.path;
    }
    bool operator!=(const ChunkKey& other) const { return !(*this == other); }

    // Stable record id in the vector store.
    uint64_t id() const;
    std::string to_string() const;
};

struct ChunkKeyHash {
    size_t operator()(const ChunkKey& key) const noexcept;
};

struct Chunk {
    std::string path;
    uint32_t start_line = 0;
    uint32_t end_line = 0;
    std::string language;
    std::optional<std::string> function_name;
    std::optional<std::string> content;
    uint64_t content_hash = 0;
    std::optional<std::vector<float>> vector;
    std::optional<float> distance;

    ChunkKey key() const { return ChunkKey{path, start_line, end_line}; }
    uint64_t id() const { return key().id(); }

    // Store row: identity, attributes and (when present) the vector.
    // Content is never uploaded; it is re-read from the local tree.
    nlohmann::json to_json() const;
    static Chunk from_json(const nlohmann::json& j);
};

} // namespace codesync
