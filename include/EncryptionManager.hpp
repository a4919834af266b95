#pragma once
#include <cstdint>
#include <vector>
#include <string>

// One sealed value: AES-GCM ciphertext (with tag appended) and its nonce.
// Wire form is the JSON text {"ciphertext": b64, "iv": b64}.
struct SealedField {
    std::vector<std::uint8_t> iv;         // 12-byte nonce
    std::vector<std::uint8_t> encAndTag;  // ciphertext || 16-byte tag

    std::string serialize() const;

    // Throws std::invalid_argument when the text is not a sealed pair.
    static SealedField parse(const std::string& text);
};

// AES-256-GCM under a key derived from the user's passphrase.
// Owns the only in-memory copy of the key; it is wiped on destruction.
class EncryptionManager {
public:
    // Construct with a 32-byte key.
    explicit EncryptionManager(const std::vector<std::uint8_t>& key);
    ~EncryptionManager();

    EncryptionManager(const EncryptionManager&) = delete;
    EncryptionManager& operator=(const EncryptionManager&) = delete;

    // Fresh random nonce on every call.
    SealedField encrypt(const std::vector<std::uint8_t>& plaintext) const;

    // Throws AuthenticationError on tag verification failure,
    // std::invalid_argument on malformed input, std::runtime_error on API error.
    std::vector<std::uint8_t> decrypt(const SealedField& sealed) const;

    // Text helpers: serialized sealed pair in, UTF-8 text out (and back).
    std::string seal(const std::string& plaintext) const;
    std::string open(const std::string& serialized) const;

    static constexpr std::size_t KEY_LEN = 32;
    static constexpr std::size_t IV_LEN  = 12;
    static constexpr std::size_t TAG_LEN = 16;

private:
    std::vector<std::uint8_t> m_key;
};
