#include <catch2/catch.hpp>
#include "test_support.hpp"
#include "vector_store.hpp"
#include "turbopuffer_store.hpp"
#include "vector_codec.hpp"
#include <numeric>
#include <set>

using namespace codesync;
using codesync::testing::FakeVectorStore;
using codesync::testing::make_chunk;

namespace {

const std::string kNs = "cs_fake_test";

std::vector<Chunk> embedded_chunks(size_t n, const std::string& path = "f.rs") {
    std::vector<Chunk> chunks;
    for (size_t i = 0; i < n; ++i) {
        Chunk c = make_chunk(path, static_cast<uint32_t>(i + 1), static_cast<uint32_t>(i + 1), "", i);
        c.vector = std::vector<float>{1.0f, static_cast<float>(i)};
        chunks.push_back(std::move(c));
    }
    return chunks;
}

Chunk vector_record(const std::string& path, std::vector<float> v) {
    Chunk c = make_chunk(path, 1, 2, "", 0);
    c.vector = std::move(v);
    return c;
}

} // namespace

// ============================================================================
// apply_diff
// ============================================================================

TEST_CASE("Writes never exceed one thousand rows", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    VectorStoreClient client(backend);

    ApplySummary summary = client.apply_diff(kNs, embedded_chunks(2500), {});

    REQUIRE(summary.ok());
    REQUIRE(summary.upserted == 2500);
    REQUIRE(backend->size(kNs) == 2500);
    auto sizes = backend->write_sizes();
    REQUIRE(sizes.size() == 3);
    for (size_t s : sizes) REQUIRE(s <= VectorStoreClient::kWriteBatchSize);
}

TEST_CASE("Store requests in flight stay under the configured bound", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>(std::chrono::milliseconds(15));
    VectorStoreClient client(backend, 2);

    ApplySummary summary = client.apply_diff(kNs, embedded_chunks(6000), {});
    REQUIRE(summary.upserted == 6000);
    REQUIRE(backend->peak_in_flight() <= 2);
}

TEST_CASE("Deletes remove records by key", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    for (const auto& c : embedded_chunks(5)) backend->put(kNs, c);
    VectorStoreClient client(backend);

    std::vector<ChunkKey> deletes = {{"f.rs", 1, 1}, {"f.rs", 3, 3}};
    ApplySummary summary = client.apply_diff(kNs, std::vector<Chunk>{}, deletes);

    REQUIRE(summary.ok());
    REQUIRE(summary.deleted == 2);
    REQUIRE(backend->size(kNs) == 3);
    REQUIRE_FALSE(backend->has(kNs, ChunkKey{"f.rs", 1, 1}.id()));
    REQUIRE(backend->has(kNs, ChunkKey{"f.rs", 2, 2}.id()));
}

TEST_CASE("Failed writes are reported per batch, never thrown", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    backend->fail_writes(true);
    VectorStoreClient client(backend);

    auto upserts = embedded_chunks(1500, "a.rs");
    std::vector<ChunkKey> deletes = {{"old.rs", 1, 1}};
    ApplySummary summary = client.apply_diff(kNs, upserts, deletes);

    REQUIRE_FALSE(summary.ok());
    REQUIRE(summary.upserted == 0);
    REQUIRE(summary.failed(BatchFailure::Kind::Upsert) == 1500);
    REQUIRE(summary.failed(BatchFailure::Kind::Delete) == 1);

    std::set<std::string> paths;
    for (const auto& f : summary.failures) paths.insert(f.paths.begin(), f.paths.end());
    REQUIRE(paths == std::set<std::string>{"a.rs", "old.rs"});
}

TEST_CASE("Chunks without vectors are never written", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    VectorStoreClient client(backend);

    auto upserts = embedded_chunks(3);
    upserts[0].vector.reset();
    ApplySummary summary = client.apply_diff(kNs, upserts, {});

    REQUIRE(summary.upserted == 2);
    REQUIRE(summary.failed(BatchFailure::Kind::Upsert) == 1);
    REQUIRE(backend->size(kNs) == 2);
}

// ============================================================================
// Listing and queries
// ============================================================================

TEST_CASE("Listing pages through every record by id", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    for (const auto& c : embedded_chunks(2500)) backend->put(kNs, c);
    VectorStoreClient client(backend);

    auto listed = client.all_server_chunks(kNs);

    REQUIRE(listed.size() == 2500);
    REQUIRE(backend->query_calls() == 3);
    std::set<uint64_t> ids;
    for (const auto& c : listed) {
        ids.insert(c.id());
        REQUIRE_FALSE(c.vector.has_value());
    }
    REQUIRE(ids.size() == 2500);
}

TEST_CASE("Listing a missing namespace is empty", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    VectorStoreClient client(backend);
    REQUIRE(client.all_server_chunks("cs_never_synced").empty());
}

TEST_CASE("Listing failures other than a missing namespace propagate", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    backend->fail_queries(true);
    VectorStoreClient client(backend);
    REQUIRE_THROWS_AS(client.all_server_chunks(kNs), StoreError);
}

TEST_CASE("Queries return the nearest records first", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    backend->put(kNs, vector_record("exact.rs", {1.0f, 0.0f}));
    backend->put(kNs, vector_record("close.rs", {0.9f, 0.1f}));
    backend->put(kNs, vector_record("orthogonal.rs", {0.0f, 1.0f}));
    backend->put(kNs, vector_record("opposite.rs", {-1.0f, 0.0f}));
    backend->put(kNs, vector_record("diagonal.rs", {0.7f, 0.7f}));
    VectorStoreClient client(backend);

    auto results = client.query(kNs, {1.0f, 0.0f}, 3);

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].path == "exact.rs");
    REQUIRE(results[1].path == "close.rs");
    REQUIRE(results[2].path == "diagonal.rs");
    for (size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].distance.has_value());
        if (i > 0) REQUIRE(*results[i - 1].distance <= *results[i].distance);
    }
}

TEST_CASE("Querying a missing namespace throws", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    VectorStoreClient client(backend);
    REQUIRE_THROWS_AS(client.query("cs_missing", {1.0f}, 5), NamespaceNotFoundError);
    REQUIRE(client.query("cs_missing", {1.0f}, 0).empty());
}

TEST_CASE("Deleting a namespace drops all of its records", "[store]") {
    auto backend = std::make_shared<FakeVectorStore>();
    for (const auto& c : embedded_chunks(3)) backend->put(kNs, c);
    VectorStoreClient client(backend);

    client.delete_namespace(kNs);
    REQUIRE_FALSE(backend->has_namespace(kNs));
    REQUIRE_THROWS_AS(client.delete_namespace(kNs), NamespaceNotFoundError);
}

// ============================================================================
// turbopuffer wire format
// ============================================================================

namespace {

cpr::Response response(long status, std::string text) {
    cpr::Response r;
    r.status_code = status;
    r.text = std::move(text);
    return r;
}

} // namespace

TEST_CASE("Missing namespaces are told apart from other failures", "[store][turbopuffer]") {
    REQUIRE_THROWS_AS(throw_turbopuffer_failure(response(404, "{}"), kNs, "query"), NamespaceNotFoundError);
    REQUIRE_THROWS_AS(
        throw_turbopuffer_failure(response(400, R"({"error":"namespace 'cs_x' not found"})"), kNs, "query"),
        NamespaceNotFoundError);

    try {
        throw_turbopuffer_failure(response(500, "internal error"), kNs, "write");
        FAIL("expected a StoreError");
    } catch (const NamespaceNotFoundError&) {
        FAIL("a server error is not a missing namespace");
    } catch (const StoreError& e) {
        REQUIRE(e.status_code() == 500);
        REQUIRE(std::string(e.what()).find("write") != std::string::npos);
    }
}

TEST_CASE("Query rows are read from the response body", "[store][turbopuffer]") {
    auto rows = parse_query_rows(R"({"rows":[{"id":7,"path":"a.rs","$dist":0.25},{"id":9}]})");
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0]["id"] == 7);
    REQUIRE(rows[0]["path"] == "a.rs");

    REQUIRE(parse_query_rows(R"({"rows":[]})").empty());
    REQUIRE_THROWS_AS(parse_query_rows("not json"), StoreError);
    REQUIRE_THROWS_AS(parse_query_rows(R"({"billing":{}})"), StoreError);
    REQUIRE_THROWS_AS(parse_query_rows(R"({"rows":{"id":1}})"), StoreError);
    REQUIRE_THROWS_AS(parse_query_rows(R"({"rows":[{"path":"a.rs"}]})"), StoreError);
}

TEST_CASE("Upsert rows carry the vector as base64 f32", "[store][turbopuffer]") {
    Chunk chunk = vector_record("a.rs", {1.0f, -2.0f});
    auto row = to_upsert_row(chunk);

    REQUIRE(row["vector"].is_string());
    REQUIRE(decode_vector(row["vector"].get<std::string>()) == std::vector<float>{1.0f, -2.0f});
    REQUIRE(row["id"] == chunk.id());
    REQUIRE(row["path"] == "a.rs");
    REQUIRE(row["content_hash"] == chunk.content_hash);

    REQUIRE_THROWS_AS(to_upsert_row(make_chunk("a.rs", 1, 1, "", 0)), StoreError);
}
