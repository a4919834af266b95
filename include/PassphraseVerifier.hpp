#pragma once
#include "Clock.hpp"
#include "RemoteBackend.hpp"

#include <string>

class EncryptionManager;
class KeyMaterialStore;

enum class VerifyOutcome {
    Accepted,
    InvalidPassphrase,
    VerificationUnavailable   // could not check; not a wrong passphrase
};

const char* verifyOutcomeName(VerifyOutcome outcome);

// Decides whether a candidate key came from the right passphrase. The only
// oracle is decryption: first the local verification blob, else one real
// record from the backend. There is no server-side passphrase check.
class PassphraseVerifier {
public:
    PassphraseVerifier(KeyMaterialStore& store, RemoteBackend& remote,
                       TokenProvider tokens, Clock clock = systemNowMs);

    // On acceptance without a local blob, a fresh blob is persisted so the
    // next verification on this device is local.
    VerifyOutcome verify(const std::string& userId, const EncryptionManager& candidate);

    // Sealed {"timestamp": <ms>, "userId": <userId>}
    std::string makeVerificationBlob(const std::string& userId,
                                     const EncryptionManager& key) const;

private:
    VerifyOutcome verifyLocal(const std::string& userId, const std::string& blob,
                              const EncryptionManager& candidate) const;
    VerifyOutcome verifyRemote(const std::string& userId, const EncryptionManager& candidate);
    void persistBlob(const std::string& userId, const EncryptionManager& key);

    KeyMaterialStore& m_store;
    RemoteBackend&    m_remote;
    TokenProvider     m_tokens;
    Clock             m_clock;
};
