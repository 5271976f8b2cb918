#include <catch2/catch.hpp>
#include "diff_engine.hpp"
#include "test_support.hpp"
#include <algorithm>
#include <unordered_set>

using namespace codesync;
using codesync::testing::make_chunk;

namespace {

bool contains_key(const std::vector<ChunkKey>& keys, const ChunkKey& key) {
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

bool contains_chunk(const std::vector<Chunk>& chunks, const ChunkKey& key) {
    return std::any_of(chunks.begin(), chunks.end(), [&](const Chunk& c) { return c.key() == key; });
}

} // namespace

TEST_CASE("New, changed, removed and unchanged chunks are separated", "[diff]") {
    std::vector<Chunk> local = {
        make_chunk("a.rs", 1, 3, "same", 11),
        make_chunk("a.rs", 5, 9, "edited", 22),
        make_chunk("b.rs", 1, 1, "new", 33),
    };
    std::vector<Chunk> remote = {
        make_chunk("a.rs", 1, 3, "", 11),
        make_chunk("a.rs", 5, 9, "", 99),
        make_chunk("gone.rs", 2, 4, "", 44),
    };

    DiffResult diff = diff_chunks(local, remote);

    REQUIRE(diff.to_upsert.size() == 2);
    REQUIRE(contains_chunk(diff.to_upsert, {"a.rs", 5, 9}));
    REQUIRE(contains_chunk(diff.to_upsert, {"b.rs", 1, 1}));
    REQUIRE(diff.to_delete == std::vector<ChunkKey>{{"gone.rs", 2, 4}});
    REQUIRE(diff.unchanged == std::vector<ChunkKey>{{"a.rs", 1, 3}});
    REQUIRE(diff.to_upsert.size() + diff.unchanged.size() == local.size());
    REQUIRE_FALSE(diff.empty());
}

TEST_CASE("Upserted chunks keep their content for embedding", "[diff]") {
    std::vector<Chunk> local = {make_chunk("a.rs", 1, 1, "fn a() {}", 1)};
    DiffResult diff = diff_chunks(local, {});
    REQUIRE(diff.to_upsert.size() == 1);
    REQUIRE(diff.to_upsert[0].content == std::optional<std::string>("fn a() {}"));
}

TEST_CASE("Identical sides produce an empty diff", "[diff]") {
    std::vector<Chunk> chunks = {make_chunk("a.rs", 1, 2, "x", 1), make_chunk("b.rs", 3, 4, "y", 2)};
    DiffResult diff = diff_chunks(chunks, chunks);
    REQUIRE(diff.empty());
    REQUIRE(diff.unchanged.size() == 2);
}

TEST_CASE("An empty local tree deletes everything remote", "[diff]") {
    std::vector<Chunk> remote = {make_chunk("a.rs", 1, 2, "", 1), make_chunk("b.rs", 3, 4, "", 2)};
    DiffResult diff = diff_chunks({}, remote);
    REQUIRE(diff.to_upsert.empty());
    REQUIRE(diff.to_delete.size() == 2);
    REQUIRE(contains_key(diff.to_delete, {"a.rs", 1, 2}));
    REQUIRE(contains_key(diff.to_delete, {"b.rs", 3, 4}));
}

TEST_CASE("A moved chunk is one delete and one upsert", "[diff]") {
    std::vector<Chunk> local = {make_chunk("a.rs", 4, 6, "body", 7)};
    std::vector<Chunk> remote = {make_chunk("a.rs", 1, 3, "", 7)};
    DiffResult diff = diff_chunks(local, remote);
    REQUIRE(diff.to_upsert.size() == 1);
    REQUIRE(diff.to_delete == std::vector<ChunkKey>{{"a.rs", 1, 3}});
    REQUIRE(diff.unchanged.empty());
}

TEST_CASE("Duplicate local keys count once", "[diff]") {
    std::vector<Chunk> local = {make_chunk("a.rs", 1, 1, "first", 1), make_chunk("a.rs", 1, 1, "second", 2)};
    DiffResult diff = diff_chunks(local, {});
    REQUIRE(diff.to_upsert.size() == 1);
    REQUIRE(diff.to_upsert[0].content_hash == 1);
}

TEST_CASE("Result sets are pairwise disjoint", "[diff]") {
    std::vector<Chunk> local;
    std::vector<Chunk> remote;
    for (uint32_t i = 0; i < 50; ++i) {
        local.push_back(make_chunk("f.rs", i * 10, i * 10 + 5, "", i % 3 == 0 ? i : i + 1000));
        if (i % 2 == 0) remote.push_back(make_chunk("f.rs", i * 10, i * 10 + 5, "", i));
        if (i % 5 == 0) remote.push_back(make_chunk("old.rs", i, i, "", i));
    }

    DiffResult diff = diff_chunks(local, remote);
    std::unordered_set<ChunkKey, ChunkKeyHash> seen;
    for (const auto& c : diff.to_upsert) REQUIRE(seen.insert(c.key()).second);
    for (const auto& k : diff.to_delete) REQUIRE(seen.insert(k).second);
    for (const auto& k : diff.unchanged) REQUIRE(seen.insert(k).second);
    REQUIRE(diff.to_upsert.size() + diff.unchanged.size() == local.size());
}
