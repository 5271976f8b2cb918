#include <catch2/catch.hpp>
#include "vector_codec.hpp"
#include <stdexcept>

using namespace codesync;

TEST_CASE("base64 matches the RFC 4648 test vectors", "[codec]") {
    REQUIRE(base64_encode("") == "");
    REQUIRE(base64_encode("f") == "Zg==");
    REQUIRE(base64_encode("fo") == "Zm8=");
    REQUIRE(base64_encode("foo") == "Zm9v");
    REQUIRE(base64_encode("foob") == "Zm9vYg==");
    REQUIRE(base64_encode("foobar") == "Zm9vYmFy");

    REQUIRE(base64_decode("") == "");
    REQUIRE(base64_decode("Zg==") == "f");
    REQUIRE(base64_decode("Zm8=") == "fo");
    REQUIRE(base64_decode("Zm9vYmFy") == "foobar");
}

TEST_CASE("base64 decoding rejects malformed text", "[codec]") {
    REQUIRE_THROWS_AS(base64_decode("Zm9"), std::invalid_argument);
    REQUIRE_THROWS_AS(base64_decode("Zm9*"), std::invalid_argument);
    REQUIRE_THROWS_AS(base64_decode("Zg==Zm9v"), std::invalid_argument);
}

TEST_CASE("Vectors are little-endian f32 in base64", "[codec]") {
    REQUIRE(encode_vector({1.0f}) == "AACAPw==");
    REQUIRE(encode_vector({}) == "");

    auto decoded = decode_vector("AACAPw==");
    REQUIRE(decoded.size() == 1);
    REQUIRE(decoded[0] == 1.0f);

    std::vector<float> values{0.25f, -3.5f, 1e-7f};
    REQUIRE(decode_vector(encode_vector(values)) == values);
}

TEST_CASE("Vector payloads must be whole floats", "[codec]") {
    // six bytes
    REQUIRE_THROWS_AS(decode_vector("AAAAAAAA"), std::invalid_argument);
}
