#include "Encoding.hpp"

#include <openssl/evp.h>
#include <stdexcept>

std::string toBase64(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) return {};

    // 4 output chars per 3 input bytes, plus NUL written by EVP_EncodeBlock
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            bytes.data(), static_cast<int>(bytes.size()));
    if (n < 0) {
        throw std::runtime_error("EVP_EncodeBlock failed");
    }
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::vector<std::uint8_t> fromBase64(const std::string& text) {
    if (text.empty()) return {};
    if (text.size() % 4 != 0) {
        throw std::invalid_argument("fromBase64: length is not a multiple of 4");
    }

    std::vector<std::uint8_t> out(3 * (text.size() / 4));
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0) {
        throw std::invalid_argument("fromBase64: invalid base64 input");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding
    std::size_t pad = 0;
    if (text[text.size() - 1] == '=') ++pad;
    if (text[text.size() - 2] == '=') ++pad;
    out.resize(static_cast<std::size_t>(n) - pad);
    return out;
}
