#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "chunker.hpp"
#include "embedding_service.hpp"
#include "vector_store.hpp"

namespace codesync {

namespace fs = std::filesystem;

enum class SyncStage { Start, Chunking, RemoteFetch, Diffed, Embedding, Applying, Done };

const char* to_string(SyncStage stage);

struct SyncOptions {
    ChunkOptions chunk_options;
    size_t channel_capacity = 256;
};

struct SyncReport {
    size_t found = 0;
    size_t to_upsert = 0;
    size_t to_delete = 0;
    size_t unchanged = 0;
    size_t embedded = 0;
    size_t embed_failed = 0;
    size_t upserted = 0;
    size_t deleted = 0;
    size_t upsert_failed = 0;
    size_t delete_failed = 0;
    std::vector<std::string> failed_paths; // distinct, sorted
    std::vector<FileIssue> file_issues;
    std::vector<std::string> errors;       // one line per failed batch
    bool changed = false;

    // No embedding or store batch failed. File issues are warnings.
    bool ok() const { return embed_failed == 0 && upsert_failed == 0 && delete_failed == 0; }
};

// Start -> (Chunking || RemoteFetch) -> Diffed -> Embedding -> Applying -> Done
class SyncService {
public:
    SyncService(EmbeddingService& embedding_service, VectorStoreClient& store);

    // Throws StoreError when the remote listing fails for any reason other
    // than a missing namespace; nothing has been written at that point.
    SyncReport perform_sync(const fs::path& root, const std::string& ns,
                            const SyncOptions& options = {});

private:
    EmbeddingService& embedding_service_;
    VectorStoreClient& store_;

    void enter(SyncStage stage, const std::string& detail = "") const;
};

} // namespace codesync
