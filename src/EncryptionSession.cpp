#include "EncryptionSession.hpp"
#include "Encoding.hpp"
#include "EncryptionErrors.hpp"
#include "EncryptionManager.hpp"
#include "KeyMaterialStore.hpp"
#include "LockoutTracker.hpp"
#include "RecordCodec.hpp"

#include <openssl/crypto.h>
#include <loguru.hpp>
#include <stdexcept>
#include <utility>

const char* sessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Uninitialized: return "uninitialized";
    case SessionState::NotSetup:      return "not-setup";
    case SessionState::Locked:        return "locked";
    case SessionState::Unlocked:      return "unlocked";
    case SessionState::Error:         return "error";
    }
    return "unknown";
}

namespace {
    // Key bytes leave this function only inside an EncryptionManager
    std::unique_ptr<EncryptionManager> deriveManager(const std::string& passphrase,
                                                     const std::vector<std::uint8_t>& salt,
                                                     const KdfParams& kdf) {
        auto key = KeyDerivation::deriveKey(passphrase, salt, kdf);
        std::unique_ptr<EncryptionManager> enc;
        try {
            enc = std::make_unique<EncryptionManager>(key);
        } catch (...) {
            OPENSSL_cleanse(key.data(), key.size());
            throw;
        }
        OPENSSL_cleanse(key.data(), key.size());
        return enc;
    }
}

EncryptionSession::EncryptionSession(std::string userId,
                                     TokenProvider tokens,
                                     RemoteBackend& remote,
                                     KeyMaterialStore& store,
                                     KdfParams kdf,
                                     LockoutTracker* tracker,
                                     Clock clock)
    : m_userId(std::move(userId)),
      m_tokens(std::move(tokens)),
      m_remote(remote),
      m_store(store),
      m_kdf(kdf),
      m_tracker(tracker),
      m_clock(std::move(clock)),
      m_verifier(store, remote, m_tokens, m_clock)
{
    if (m_userId.empty()) {
        throw std::invalid_argument("EncryptionSession: userId must not be empty");
    }
}

EncryptionSession::~EncryptionSession() = default;

SessionState EncryptionSession::initialize() {
    std::lock_guard<std::mutex> op(m_opMutex);
    return initializeLocked();
}

SessionState EncryptionSession::initializeLocked() {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        // Never reset a session that already holds its key
        if (m_state == SessionState::Unlocked && m_key) return m_state;
        if (m_hasCheckedSetup && m_state == SessionState::Locked) return m_state;
    }

    bool hasLocalBlob = false;
    std::optional<std::string> localSalt;
    try {
        hasLocalBlob = m_store.has(m_userId);
        localSalt = m_store.loadSalt(m_userId);
    } catch (const std::runtime_error& ex) {
        LOG_F(WARNING, "Key-material store unreadable, asking backend: %s", ex.what());
    }

    if (hasLocalBlob) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_state = SessionState::Locked;
        m_hasCheckedSetup = true;
        if (localSalt && !m_salt) m_salt = localSalt;
        LOG_F(INFO, "Encryption configured on this device; state=locked");
        return m_state;
    }

    EncryptionStatus status;
    try {
        status = m_remote.getEncryptionStatus(token());
    } catch (const std::exception& ex) {
        LOG_F(ERROR, "Failed to fetch encryption status: %s", ex.what());
        throw VerificationUnavailable(ex.what());
    }

    if (status.salt && !localSalt) {
        try {
            m_store.storeSalt(m_userId, *status.salt);
        } catch (const std::exception& ex) {
            LOG_F(WARNING, "Could not keep salt locally: %s", ex.what());
        }
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (status.hasSalt) {
        if (status.salt) m_salt = status.salt;
        m_state = SessionState::Locked;
        m_hasCheckedSetup = true;
        LOG_F(INFO, "Encryption configured on another device; state=locked");
    } else if (status.hasAnalyses) {
        m_state = SessionState::Error;
        LOG_F(ERROR, "User has encrypted records but no salt: data inconsistency");
    } else {
        m_state = SessionState::NotSetup;
        LOG_F(INFO, "Encryption not set up for this user");
    }
    return m_state;
}

void EncryptionSession::setup(const std::string& passphrase) {
    std::lock_guard<std::mutex> op(m_opMutex);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_state == SessionState::Error) throw DataInconsistency();
        if (m_state != SessionState::NotSetup) {
            throw InvalidState(std::string("setup() needs state not-setup, session is ")
                               + sessionStateName(m_state));
        }
    }
    if (passphrase.empty()) {
        throw std::invalid_argument("setup: passphrase must not be empty");
    }

    const auto salt = KeyDerivation::generateSalt();
    const std::string saltB64 = toBase64(salt);
    auto enc = deriveManager(passphrase, salt, m_kdf);

    // Backend first: if it refuses, nothing local refers to this salt
    try {
        m_remote.saveSalt(token(), saltB64);
    } catch (const std::exception& ex) {
        LOG_F(ERROR, "Failed to save salt: %s", ex.what());
        throw;
    }

    m_store.storeSalt(m_userId, saltB64);
    m_store.store(m_userId, m_verifier.makeVerificationBlob(m_userId, *enc));

    commitUnlocked(SessionState::NotSetup, std::move(enc), saltB64);
    LOG_F(INFO, "Encryption set up (%s); state=unlocked", kdfAlgorithmName(m_kdf.algorithm));
}

void EncryptionSession::unlock(const std::string& passphrase) {
    std::lock_guard<std::mutex> op(m_opMutex);

    SessionState current;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        current = m_state;
    }
    if (current == SessionState::Uninitialized) {
        current = initializeLocked();
    }
    switch (current) {
    case SessionState::Unlocked: throw InvalidState("Encryption already unlocked");
    case SessionState::Error:    throw DataInconsistency();
    case SessionState::NotSetup: throw InvalidState("Salt not found. Please set up encryption first.");
    default: break;
    }
    if (passphrase.empty()) {
        throw std::invalid_argument("unlock: passphrase must not be empty");
    }

    const std::string tok = token();

    // The backend's counter decides, not the local countdown cache
    UnlockAttemptStatus attempts;
    try {
        attempts = m_remote.getUnlockAttempts(tok);
    } catch (const std::exception& ex) {
        LOG_F(WARNING, "Unlock-attempt status unavailable: %s", ex.what());
        throw VerificationUnavailable(ex.what());
    }
    const std::int64_t now = m_clock();
    if (attempts.lockedUntil && *attempts.lockedUntil > now) {
        if (m_tracker) m_tracker->apply(m_userId, attempts);
        LOG_F(WARNING, "Unlock refused: locked out");
        throw LockedOut((*attempts.lockedUntil - now + 999) / 1000);
    }

    const auto salt = resolveSalt(tok);
    auto enc = deriveManager(passphrase, salt, m_kdf);

    switch (m_verifier.verify(m_userId, *enc)) {
    case VerifyOutcome::Accepted:
        reportAttempt(tok, true);
        commitUnlocked(SessionState::Locked, std::move(enc), toBase64(salt));
        LOG_F(INFO, "Encryption unlocked; state=unlocked");
        return;
    case VerifyOutcome::InvalidPassphrase:
        reportAttempt(tok, false);
        LOG_F(WARNING, "Unlock failed: invalid passphrase");
        throw InvalidPassphrase();
    case VerifyOutcome::VerificationUnavailable:
        LOG_F(WARNING, "Unlock failed: verification unavailable");
        throw VerificationUnavailable("backend unreachable, please try again");
    }
}

void EncryptionSession::lock() {
    std::lock_guard<std::mutex> op(m_opMutex);
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_key.reset();
    if (m_state == SessionState::Unlocked) {
        m_state = SessionState::Locked;
        LOG_F(INFO, "Encryption locked");
    }
    m_hasCheckedSetup = false;
}

void EncryptionSession::signOut() {
    std::lock_guard<std::mutex> op(m_opMutex);
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_key.reset();
        m_state = SessionState::Uninitialized;
        m_hasCheckedSetup = false;
    }
    try {
        m_store.clear(m_userId);
    } catch (const std::runtime_error& ex) {
        LOG_F(WARNING, "Could not clear verification blob on sign-out: %s", ex.what());
    }
    LOG_F(INFO, "Signed out; key discarded");
}

SessionState EncryptionSession::state() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state;
}

bool EncryptionSession::isSetup() const {
    const SessionState s = state();
    return s == SessionState::Locked || s == SessionState::Unlocked;
}

bool EncryptionSession::isUnlocked() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_state == SessionState::Unlocked && m_key != nullptr;
}

std::optional<std::string> EncryptionSession::salt() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_salt;
}

EncryptedRecord EncryptionSession::encryptData(const AnalysisRecord& record) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_key) throw NotUnlocked();
    return encryptRecord(record, *m_key);
}

AnalysisRecord EncryptionSession::decryptData(const EncryptedRecord& record) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_key) throw NotUnlocked();
    return decryptRecord(record, *m_key);
}

std::vector<HistoryItem> EncryptionSession::decryptHistory(
    const std::vector<EncryptedRecord>& records) const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (!m_key) throw NotUnlocked();

    std::vector<HistoryItem> out;
    out.reserve(records.size());
    for (const auto& r : records) {
        HistoryItem item;
        try {
            item.record = decryptRecord(r, *m_key);
            item.decrypted = true;
        } catch (const AuthenticationError&) {
            LOG_F(WARNING, "Failed to decrypt analysis %s", r.id.c_str());
        } catch (const std::invalid_argument&) {
            LOG_F(WARNING, "Malformed analysis %s", r.id.c_str());
        }
        if (!item.decrypted) {
            item.record = AnalysisRecord{};
            item.record.id           = r.id;
            item.record.userEmail    = "[Encrypted]";
            item.record.inputContent = "[Decryption failed]";
            item.record.mlResult     = MlResult{};
            item.record.inputType    = r.inputType;
            item.record.createdAt    = r.createdAt;
            item.record.updatedAt    = r.updatedAt;
        }
        out.push_back(std::move(item));
    }
    return out;
}

std::string EncryptionSession::saveRecord(const AnalysisRecord& record) {
    EncryptedRecord sealed = encryptData(record);
    return m_remote.saveRecord(token(), sealed);
}

std::vector<HistoryItem> EncryptionSession::loadHistory(std::size_t limit) {
    if (!isUnlocked()) throw NotUnlocked();
    return decryptHistory(m_remote.listRecords(token(), limit));
}

std::vector<std::uint8_t> EncryptionSession::resolveSalt(const std::string& tok) {
    std::optional<std::string> saltB64;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        saltB64 = m_salt;
    }
    if (!saltB64) {
        try {
            saltB64 = m_store.loadSalt(m_userId);
        } catch (const std::runtime_error& ex) {
            LOG_F(WARNING, "Local salt unreadable: %s", ex.what());
        }
    }
    if (!saltB64) {
        EncryptionStatus status;
        try {
            status = m_remote.getEncryptionStatus(tok);
        } catch (const std::exception& ex) {
            LOG_F(WARNING, "Failed to fetch salt: %s", ex.what());
            throw VerificationUnavailable(ex.what());
        }
        if (!status.salt) {
            throw InvalidState("Salt not found. Please set up encryption first.");
        }
        saltB64 = status.salt;
        try {
            m_store.storeSalt(m_userId, *saltB64);
        } catch (const std::runtime_error& ex) {
            LOG_F(WARNING, "Could not keep salt locally: %s", ex.what());
        }
    }

    std::vector<std::uint8_t> salt;
    try {
        salt = fromBase64(*saltB64);
    } catch (const std::invalid_argument&) {
        salt.clear();
    }
    if (salt.size() != KeyDerivation::SALT_LEN) {
        LOG_F(ERROR, "Stored salt is malformed");
        throw EncryptionError("Stored salt is malformed");
    }
    return salt;
}

void EncryptionSession::reportAttempt(const std::string& tok, bool success) {
    UnlockAttemptStatus reported;
    try {
        reported = m_remote.recordUnlockAttempt(tok, success);
    } catch (const std::exception& ex) {
        LOG_F(WARNING, "Could not report unlock attempt: %s", ex.what());
        return;
    }
    if (m_tracker) m_tracker->apply(m_userId, reported);
}

std::string EncryptionSession::token() const {
    if (!m_tokens) {
        throw std::logic_error("EncryptionSession: no token provider");
    }
    return m_tokens();
}

void EncryptionSession::commitUnlocked(SessionState expected,
                                       std::unique_ptr<EncryptionManager> key,
                                       const std::string& saltB64) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_state != expected) {
        // Result of an operation that no longer matches the session
        throw InvalidState(std::string("session changed to ") + sessionStateName(m_state)
                           + " during the operation");
    }
    m_key = std::move(key);
    m_salt = saltB64;
    m_state = SessionState::Unlocked;
    m_hasCheckedSetup = true;
}
