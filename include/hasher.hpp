#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace codesync {

// 64-bit xxHash. Stable across runs and platforms (little-endian reads),
// which is what makes content hashes and record ids comparable with what
// an earlier pass stored remotely.
uint64_t xxhash64(const void* data, size_t len, uint64_t seed = 0);

inline uint64_t xxhash64(std::string_view bytes, uint64_t seed = 0) {
    return xxhash64(bytes.data(), bytes.size(), seed);
}

// Lower-case hex, no padding.
std::string to_hex(uint64_t value);

} // namespace codesync
