#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace stakerep {
namespace crypto {

constexpr size_t SHA256_SIZE = 32;

using Hash256 = std::array<uint8_t, SHA256_SIZE>;

Hash256 sha256(const uint8_t* data, size_t len);
Hash256 sha256(const std::string& data);
std::string sha256Hex(const std::string& data);

std::string toHex(const uint8_t* data, size_t len);
template<size_t N>
std::string toHex(const std::array<uint8_t, N>& data) {
    return toHex(data.data(), N);
}

std::vector<uint8_t> base64Encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64Decode(const std::vector<uint8_t>& data);
std::string base64EncodeString(const std::string& data);

// Strict check: standard alphabet, length a multiple of four, padding only
// at the end.
bool isBase64(const std::string& data);

}
}
