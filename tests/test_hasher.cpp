#include <catch2/catch.hpp>
#include "chunk.hpp"
#include "hasher.hpp"

using namespace codesync;

TEST_CASE("xxhash64 matches reference values", "[hasher]") {
    REQUIRE(xxhash64("") == 0xEF46DB3751D8E999ULL);
    REQUIRE(xxhash64("abc") == 0x44BC2CF5AD770999ULL);
}

TEST_CASE("xxhash64 is deterministic and seed sensitive", "[hasher]") {
    std::string text(1000, 'x');
    REQUIRE(xxhash64(text) == xxhash64(text));
    REQUIRE(xxhash64(text, 1) != xxhash64(text, 2));
    REQUIRE(xxhash64("fn a() {}") != xxhash64("fn b() {}"));
}

TEST_CASE("to_hex is lower-case without padding", "[hasher]") {
    REQUIRE(to_hex(0) == "0");
    REQUIRE(to_hex(255) == "ff");
    REQUIRE(to_hex(0xEF46DB3751D8E999ULL) == "ef46db3751d8e999");
}

TEST_CASE("Chunk ids depend only on the key", "[hasher][chunk]") {
    ChunkKey key{"src/lib.rs", 2, 4};
    REQUIRE(key.to_string() == "src/lib.rs:2:4");
    REQUIRE(key.id() == xxhash64("src/lib.rs:2:4"));

    Chunk a;
    a.path = "src/lib.rs";
    a.start_line = 2;
    a.end_line = 4;
    a.content_hash = 1;
    Chunk b = a;
    b.content_hash = 2;
    b.content = "changed";
    REQUIRE(a.id() == b.id());
    REQUIRE(a.key() == key);
    REQUIRE(ChunkKey{"src/lib.rs", 2, 5} != key);
}

TEST_CASE("Chunk rows carry attributes but never content", "[chunk]") {
    Chunk chunk;
    chunk.path = "a.py";
    chunk.start_line = 3;
    chunk.end_line = 7;
    chunk.language = "python";
    chunk.function_name = "run";
    chunk.content = "def run(): pass";
    chunk.content_hash = 42;
    chunk.vector = std::vector<float>{0.5f, 0.25f};

    auto row = chunk.to_json();
    REQUIRE(row.at("id").get<uint64_t>() == chunk.id());
    REQUIRE(row.at("function_name") == "run");
    REQUIRE_FALSE(row.contains("content"));

    row["$dist"] = 0.5;
    Chunk back = Chunk::from_json(row);
    REQUIRE(back.key() == chunk.key());
    REQUIRE(back.content_hash == 42);
    REQUIRE(back.function_name == std::optional<std::string>("run"));
    REQUIRE(back.distance.has_value());
    REQUIRE_FALSE(back.content.has_value());

    chunk.function_name.reset();
    REQUIRE(chunk.to_json().at("function_name").is_null());
}
