#pragma once
#include <cstdint>
#include <string>
#include <vector>

enum class KdfAlgorithm {
    Pbkdf2Sha256,   // default; what every existing record was sealed with
    Argon2id
};

struct KdfParams {
    KdfAlgorithm algorithm = KdfAlgorithm::Pbkdf2Sha256;
    std::uint32_t iterations = 100000;          // PBKDF2 rounds

    // Argon2id only
    std::uint32_t argon2TCost = 3;
    std::uint32_t argon2MCostKiB = 64 * 1024;   // ~64 MiB
    std::uint32_t argon2Parallelism = 1;
};

// Parses "pbkdf2-sha256" / "argon2id". Throws std::invalid_argument otherwise.
KdfAlgorithm parseKdfAlgorithm(const std::string& name);
const char* kdfAlgorithmName(KdfAlgorithm algorithm);

// Turns (passphrase, salt, params) into a 256-bit key. Deterministic.
class KeyDerivation {
public:
    static constexpr std::size_t SALT_LEN = 16;
    static constexpr std::size_t KEY_LEN = 32;

    // Throws std::invalid_argument when the salt is not 16 bytes or the
    // iteration count is zero or above INT_MAX.
    static std::vector<std::uint8_t> deriveKey(const std::string& passphrase,
                                               const std::vector<std::uint8_t>& salt,
                                               const KdfParams& params = KdfParams{});

    // 16 fresh bytes from the OpenSSL CSPRNG.
    static std::vector<std::uint8_t> generateSalt();
};
