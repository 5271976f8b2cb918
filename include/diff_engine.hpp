#pragma once
#include <vector>
#include "chunk.hpp"

namespace codesync {

// Pairwise disjoint by key.
struct DiffResult {
    std::vector<Chunk> to_upsert;
    std::vector<ChunkKey> to_delete;
    std::vector<ChunkKey> unchanged;

    bool empty() const { return to_upsert.empty() && to_delete.empty(); }
};

// Local chunks absent remotely or with a different content hash are upserted,
// remote keys absent locally are deleted. Only keys and hashes are compared.
// A key repeated in `local` counts once (first occurrence).
DiffResult diff_chunks(const std::vector<Chunk>& local, const std::vector<Chunk>& remote);

} // namespace codesync
