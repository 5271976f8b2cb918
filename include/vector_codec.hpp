#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace codesync {

// Standard base64 (with padding) over raw bytes.
std::string base64_encode(std::string_view bytes);

// Throws std::invalid_argument on characters outside the alphabet or a bad length.
std::string base64_decode(std::string_view text);

// Vectors travel as base64 of little-endian f32, a third of the JSON float text.
std::string encode_vector(const std::vector<float>& vector);

// Throws std::invalid_argument when the payload is not a whole number of floats.
std::vector<float> decode_vector(std::string_view text);

} // namespace codesync
