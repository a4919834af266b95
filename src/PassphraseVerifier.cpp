#include "PassphraseVerifier.hpp"
#include "EncryptionErrors.hpp"
#include "EncryptionManager.hpp"
#include "KeyMaterialStore.hpp"
#include "RecordCodec.hpp"

#include <loguru.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

const char* verifyOutcomeName(VerifyOutcome outcome) {
    switch (outcome) {
    case VerifyOutcome::Accepted:                return "accepted";
    case VerifyOutcome::InvalidPassphrase:       return "invalid-passphrase";
    case VerifyOutcome::VerificationUnavailable: return "unavailable";
    }
    return "unknown";
}

PassphraseVerifier::PassphraseVerifier(KeyMaterialStore& store, RemoteBackend& remote,
                                       TokenProvider tokens, Clock clock)
    : m_store(store), m_remote(remote), m_tokens(std::move(tokens)), m_clock(std::move(clock))
{
}

VerifyOutcome PassphraseVerifier::verify(const std::string& userId,
                                         const EncryptionManager& candidate) {
    std::optional<std::string> blob;
    try {
        blob = m_store.get(userId);
    } catch (const std::runtime_error& ex) {
        LOG_F(ERROR, "Key-material store unreadable: %s", ex.what());
        return VerifyOutcome::VerificationUnavailable;
    }

    if (blob) {
        return verifyLocal(userId, *blob, candidate);
    }
    return verifyRemote(userId, candidate);
}

std::string PassphraseVerifier::makeVerificationBlob(const std::string& userId,
                                                     const EncryptionManager& key) const {
    nlohmann::json payload;
    payload["timestamp"] = m_clock();
    payload["userId"] = userId;
    return key.seal(payload.dump());
}

VerifyOutcome PassphraseVerifier::verifyLocal(const std::string& userId,
                                              const std::string& blob,
                                              const EncryptionManager& candidate) const {
    std::string text;
    try {
        text = candidate.open(blob);
    } catch (const AuthenticationError&) {
        return VerifyOutcome::InvalidPassphrase;
    } catch (const std::invalid_argument&) {
        // Unparseable blob cannot vouch for any key
        LOG_F(WARNING, "Local verification blob is malformed");
        return VerifyOutcome::InvalidPassphrase;
    }

    auto payload = nlohmann::json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()
        || !payload.contains("userId") || !payload["userId"].is_string()
        || payload["userId"].get<std::string>() != userId) {
        return VerifyOutcome::InvalidPassphrase;
    }
    return VerifyOutcome::Accepted;
}

VerifyOutcome PassphraseVerifier::verifyRemote(const std::string& userId,
                                               const EncryptionManager& candidate) {
    std::vector<EncryptedRecord> page;
    try {
        page = m_remote.listRecords(m_tokens(), 1);
    } catch (const std::exception& ex) {
        LOG_F(WARNING, "Could not fetch a record to verify against: %s", ex.what());
        return VerifyOutcome::VerificationUnavailable;
    }

    if (page.empty()) {
        // Nothing exists yet that the key could be checked against
        LOG_F(WARNING, "No encrypted records to verify against; accepting passphrase unverified");
        persistBlob(userId, candidate);
        return VerifyOutcome::Accepted;
    }

    try {
        decryptRecord(page.front(), candidate);
    } catch (const AuthenticationError&) {
        return VerifyOutcome::InvalidPassphrase;
    } catch (const std::invalid_argument&) {
        return VerifyOutcome::InvalidPassphrase;
    }

    persistBlob(userId, candidate);
    return VerifyOutcome::Accepted;
}

void PassphraseVerifier::persistBlob(const std::string& userId, const EncryptionManager& key) {
    try {
        m_store.store(userId, makeVerificationBlob(userId, key));
    } catch (const std::runtime_error& ex) {
        // The passphrase is verified either way; the next unlock just takes the remote path again
        LOG_F(WARNING, "Could not persist verification blob: %s", ex.what());
    }
}
