#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "chunk.hpp"
#include "embedding_service.hpp"
#include "sync_service.hpp"
#include "vector_store.hpp"

namespace codesync {

class SearchEngine {
public:
    SearchEngine(EmbeddingService& embedding_service, VectorStoreClient& store)
        : embedding_service_(embedding_service), store_(store) {}

    // Nearest chunks first, content re-read from the local tree (left empty
    // when the file is gone). Throws EmbeddingError on an empty query and
    // StoreError / NamespaceNotFoundError from the store.
    std::vector<Chunk> search(const std::string& query, const std::filesystem::path& root,
                              const std::string& ns, uint32_t max_count);

    // "path:start_line:preview", or "path:start_line:distance:preview" with scores.
    static std::string format_result(const Chunk& chunk, bool with_scores);

private:
    EmbeddingService& embedding_service_;
    VectorStoreClient& store_;
};

struct SyncedSearch {
    std::vector<Chunk> results;
    std::optional<SyncReport> report; // empty when the sync pass threw
    std::string sync_error;
    bool requeried = false;
};

// Runs a sync pass next to the query so results never wait on indexing.
// Queries again once the pass is done if the namespace did not exist yet or
// the pass changed it. A failed pass only surfaces when there was no index
// to answer from; otherwise it is logged and the first results stand.
SyncedSearch search_with_sync(SearchEngine& engine, SyncService& sync,
                              const std::string& query, const std::filesystem::path& root,
                              const std::string& ns, uint32_t max_count,
                              const SyncOptions& options = {});

// Lines [start_line, end_line] (1-based, inclusive) of a file, or nullopt.
std::optional<std::string> read_line_range(const std::filesystem::path& file,
                                           uint32_t start_line, uint32_t end_line);

} // namespace codesync
