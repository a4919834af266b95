#include "KeyDerivation.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <argon2.h>
#include <limits>
#include <stdexcept>

KdfAlgorithm parseKdfAlgorithm(const std::string& name) {
    if (name == "pbkdf2-sha256") return KdfAlgorithm::Pbkdf2Sha256;
    if (name == "argon2id")      return KdfAlgorithm::Argon2id;
    throw std::invalid_argument("unknown kdf algorithm: " + name);
}

const char* kdfAlgorithmName(KdfAlgorithm algorithm) {
    switch (algorithm) {
    case KdfAlgorithm::Pbkdf2Sha256: return "pbkdf2-sha256";
    case KdfAlgorithm::Argon2id:     return "argon2id";
    }
    return "unknown";
}

std::vector<std::uint8_t> KeyDerivation::deriveKey(
    const std::string& passphrase,
    const std::vector<std::uint8_t>& salt,
    const KdfParams& params
) {
    if (salt.size() != SALT_LEN) {
        throw std::invalid_argument("deriveKey: salt must be 16 bytes");
    }
    std::vector<std::uint8_t> key(KEY_LEN);

    if (params.algorithm == KdfAlgorithm::Argon2id) {
        int rc = argon2id_hash_raw(
            params.argon2TCost,
            params.argon2MCostKiB,
            params.argon2Parallelism,
            passphrase.data(), passphrase.size(),
            salt.data(), salt.size(),
            key.data(), key.size()
        );
        if (rc != ARGON2_OK) {
            throw std::runtime_error(std::string("argon2id_hash_raw failed: ")
                                     + argon2_error_message(rc));
        }
        return key;
    }

    if (params.iterations == 0
        || params.iterations > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("deriveKey: iterations must be in 1..INT_MAX");
    }
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          static_cast<int>(params.iterations),
                          EVP_sha256(),
                          static_cast<int>(key.size()), key.data()) != 1) {
        throw std::runtime_error("PKCS5_PBKDF2_HMAC failed");
    }
    return key;
}

std::vector<std::uint8_t> KeyDerivation::generateSalt() {
    std::vector<std::uint8_t> salt(SALT_LEN);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed for salt");
    }
    return salt;
}
