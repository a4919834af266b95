#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Base64 (standard alphabet, padded) used for every byte string that leaves
// the process: salts, nonces, ciphertexts.
std::string toBase64(const std::vector<std::uint8_t>& bytes);

// Throws std::invalid_argument on malformed input.
std::vector<std::uint8_t> fromBase64(const std::string& text);

inline std::vector<std::uint8_t> toBytes(const std::string& s) {
    return { s.begin(), s.end() };
}

inline std::string toString(const std::vector<std::uint8_t>& bytes) {
    return { bytes.begin(), bytes.end() };
}
