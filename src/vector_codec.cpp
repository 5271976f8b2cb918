#include "vector_codec.hpp"
#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace codesync {

namespace {

const char* kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string base64_encode(std::string_view bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += kAlphabet[n & 0x3F];
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = static_cast<uint8_t>(bytes[i]) << 16;
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (static_cast<uint8_t>(bytes[i]) << 16) | (static_cast<uint8_t>(bytes[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 0x3F];
        out += kAlphabet[(n >> 12) & 0x3F];
        out += kAlphabet[(n >> 6) & 0x3F];
        out += '=';
    }
    return out;
}

std::string base64_decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("base64 length " + std::to_string(text.size()) + " is not a multiple of 4");
    }

    size_t padding = 0;
    if (!text.empty() && text.back() == '=') ++padding;
    if (text.size() > 1 && text[text.size() - 2] == '=') ++padding;

    std::string out;
    out.reserve(text.size() / 4 * 3);
    for (size_t i = 0; i < text.size(); i += 4) {
        bool last = i + 4 == text.size();
        uint32_t n = 0;
        for (size_t k = 0; k < 4; ++k) {
            char c = text[i + k];
            int v = 0;
            if (c == '=' && last && k >= 4 - padding) {
                v = 0;
            } else {
                v = decode_char(c);
                if (v < 0) throw std::invalid_argument("invalid base64 character at " + std::to_string(i + k));
            }
            n = (n << 6) | static_cast<uint32_t>(v);
        }
        out += static_cast<char>((n >> 16) & 0xFF);
        if (!(last && padding >= 2)) out += static_cast<char>((n >> 8) & 0xFF);
        if (!(last && padding >= 1)) out += static_cast<char>(n & 0xFF);
    }
    return out;
}

std::string encode_vector(const std::vector<float>& vector) {
    std::string bytes;
    bytes.reserve(vector.size() * 4);
    for (float f : vector) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        bytes += static_cast<char>(bits & 0xFF);
        bytes += static_cast<char>((bits >> 8) & 0xFF);
        bytes += static_cast<char>((bits >> 16) & 0xFF);
        bytes += static_cast<char>((bits >> 24) & 0xFF);
    }
    return base64_encode(bytes);
}

std::vector<float> decode_vector(std::string_view text) {
    std::string bytes = base64_decode(text);
    if (bytes.size() % 4 != 0) {
        throw std::invalid_argument("vector payload of " + std::to_string(bytes.size()) + " bytes is not f32");
    }

    std::vector<float> out;
    out.reserve(bytes.size() / 4);
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t bits = static_cast<uint32_t>(static_cast<uint8_t>(bytes[i])) |
                        (static_cast<uint32_t>(static_cast<uint8_t>(bytes[i + 1])) << 8) |
                        (static_cast<uint32_t>(static_cast<uint8_t>(bytes[i + 2])) << 16) |
                        (static_cast<uint32_t>(static_cast<uint8_t>(bytes[i + 3])) << 24);
        float f;
        std::memcpy(&f, &bits, sizeof(f));
        out.push_back(f);
    }
    return out;
}

} // namespace codesync
