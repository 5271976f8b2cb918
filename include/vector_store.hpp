#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Channel.hpp"
#include "chunk.hpp"
#include "errors.hpp"

namespace codesync {

struct StoreQuery {
    nlohmann::json rank_by;                // ["vector","ANN",[...]] or ["id","asc"]
    uint32_t top_k = 10;
    std::optional<nlohmann::json> filters; // e.g. ["id","Gt",123]
};

// Remote namespace operations. Implementations throw StoreError, or
// NamespaceNotFoundError when the namespace does not exist.
class VectorStoreBackend {
public:
    virtual ~VectorStoreBackend() = default;

    // One request: upsert rows (Chunk::to_json, vector required) and delete ids.
    virtual void write(const std::string& ns,
                       const std::vector<Chunk>& upserts,
                       const std::vector<uint64_t>& delete_ids) = 0;

    // Rows carry "id", the stored attributes and "$dist" for vector queries.
    virtual std::vector<nlohmann::json> query(const std::string& ns, const StoreQuery& query) = 0;

    virtual void delete_namespace(const std::string& ns) = 0;
};

struct BatchFailure {
    enum class Kind { Upsert, Delete };

    Kind kind = Kind::Upsert;
    size_t count = 0;
    std::vector<std::string> paths; // distinct, sorted
    std::string error;
};

struct ApplySummary {
    size_t upserted = 0;
    size_t deleted = 0;
    std::vector<BatchFailure> failures;

    size_t failed(BatchFailure::Kind kind) const;
    bool ok() const { return failures.empty(); }
};

class VectorStoreClient {
public:
    static constexpr size_t kWriteBatchSize = 1000;
    static constexpr size_t kDefaultConcurrency = 4;
    static constexpr uint32_t kPageSize = 1200;

    explicit VectorStoreClient(std::shared_ptr<VectorStoreBackend> backend,
                               size_t concurrency = kDefaultConcurrency);

    // Deletes go out first, then upserts as they arrive, at most
    // kWriteBatchSize per request and `concurrency` requests in flight.
    // Batch failures are collected, never thrown.
    ApplySummary apply_diff(const std::string& ns, Channel<Chunk>& upserts,
                            const std::vector<ChunkKey>& deletes);

    ApplySummary apply_diff(const std::string& ns, std::vector<Chunk> upserts,
                            const std::vector<ChunkKey>& deletes);

    // Every record, paged by id. Missing namespace = empty. Throws StoreError.
    std::vector<Chunk> all_server_chunks(const std::string& ns);

    // Nearest neighbours by increasing distance, at most top_k.
    // Throws StoreError / NamespaceNotFoundError.
    std::vector<Chunk> query(const std::string& ns, const std::vector<float>& vector,
                             uint32_t top_k, const std::optional<nlohmann::json>& filters = std::nullopt);

    void delete_namespace(const std::string& ns);

    size_t concurrency() const { return concurrency_; }

private:
    std::shared_ptr<VectorStoreBackend> backend_;
    size_t concurrency_;
};

} // namespace codesync
