#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <cpr/cpr.h>
#include "KeyManager.hpp"
#include "vector_store.hpp"

namespace codesync {

// Upsert row for a chunk: Chunk::to_json with the vector base64-encoded.
// Throws StoreError when the chunk has no vector.
nlohmann::json to_upsert_row(const Chunk& chunk);

// Rows of a query response body. Throws StoreError when the body is malformed.
std::vector<nlohmann::json> parse_query_rows(const std::string& body);

// Maps a failed response to its exception: NamespaceNotFoundError for a
// missing namespace, StoreError for everything else.
[[noreturn]] void throw_turbopuffer_failure(const cpr::Response& r, const std::string& ns, const char* action);

// turbopuffer v2 namespaces API over cpr.
class TurbopufferBackend : public VectorStoreBackend {
public:
    TurbopufferBackend(std::shared_ptr<KeyManager> key_manager, std::string region, long timeout_ms = 60000);

    void write(const std::string& ns,
               const std::vector<Chunk>& upserts,
               const std::vector<uint64_t>& delete_ids) override;
    std::vector<nlohmann::json> query(const std::string& ns, const StoreQuery& query) override;
    void delete_namespace(const std::string& ns) override;

    static const std::vector<std::string>& regions();

    // Round-trip time to the region's root URL, nullopt if unreachable.
    static std::optional<long> ping(const std::string& region);

    // Pings every region concurrently and keeps the fastest; falls back to
    // the default region when none answers.
    static std::string find_closest_region();

private:
    std::shared_ptr<KeyManager> key_manager_;
    std::string region_;
    long timeout_ms_;

    std::string namespace_url(const std::string& ns) const;
    cpr::Header headers() const;
};

} // namespace codesync
