#include "diff_engine.hpp"
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace codesync {

DiffResult diff_chunks(const std::vector<Chunk>& local, const std::vector<Chunk>& remote) {
    DiffResult result;

    std::unordered_map<ChunkKey, uint64_t, ChunkKeyHash> remote_hashes;
    remote_hashes.reserve(remote.size());
    for (const auto& chunk : remote) {
        remote_hashes.emplace(chunk.key(), chunk.content_hash);
    }

    std::unordered_set<ChunkKey, ChunkKeyHash> local_keys;
    local_keys.reserve(local.size());

    for (const auto& chunk : local) {
        ChunkKey key = chunk.key();
        if (!local_keys.insert(key).second) continue;

        auto it = remote_hashes.find(key);
        if (it != remote_hashes.end() && it->second == chunk.content_hash) {
            result.unchanged.push_back(std::move(key));
        } else {
            result.to_upsert.push_back(chunk);
        }
    }

    for (const auto& [key, hash] : remote_hashes) {
        if (!local_keys.count(key)) result.to_delete.push_back(key);
    }

    spdlog::debug("Diff: {} local, {} remote -> {} upsert, {} delete, {} unchanged",
                  local.size(), remote.size(), result.to_upsert.size(),
                  result.to_delete.size(), result.unchanged.size());
    return result;
}

} // namespace codesync
