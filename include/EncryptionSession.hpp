#pragma once
#include "AnalysisRecord.hpp"
#include "Clock.hpp"
#include "KeyDerivation.hpp"
#include "PassphraseVerifier.hpp"
#include "RemoteBackend.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class EncryptionManager;
class KeyMaterialStore;
class LockoutTracker;

enum class SessionState {
    Uninitialized,   // signed in, setup not yet evaluated
    NotSetup,        // no salt anywhere: setup() required
    Locked,          // set up, key not in memory
    Unlocked,        // key in memory
    Error            // backend has records but no salt; encryption disabled
};

const char* sessionStateName(SessionState state);

// One history row; `decrypted` is false for placeholders of records the
// current key could not open.
struct HistoryItem {
    AnalysisRecord record;
    bool decrypted = false;
};

// Owns the in-memory key for one signed-in user and the
// setup / unlock / lock lifecycle around it.
//
// State-changing calls are serialized; encryptData/decryptData may run
// concurrently with each other but never with the key being dropped.
class EncryptionSession {
public:
    EncryptionSession(std::string userId,
                      TokenProvider tokens,
                      RemoteBackend& remote,
                      KeyMaterialStore& store,
                      KdfParams kdf = {},
                      LockoutTracker* tracker = nullptr,
                      Clock clock = systemNowMs);
    ~EncryptionSession();

    EncryptionSession(const EncryptionSession&) = delete;
    EncryptionSession& operator=(const EncryptionSession&) = delete;

    // Local blob -> Locked; else backend status: salt -> Locked,
    // nothing -> NotSetup, records without salt -> Error.
    // Throws VerificationUnavailable when the backend cannot be asked; the
    // session then stays Uninitialized.
    SessionState initialize();

    // NotSetup -> Unlocked. Throws DataInconsistency in Error,
    // InvalidState otherwise.
    void setup(const std::string& passphrase);

    // Locked -> Unlocked. Throws LockedOut, InvalidPassphrase or
    // VerificationUnavailable and stays Locked. An unlocked session throws
    // InvalidState without looking at the passphrase.
    void unlock(const std::string& passphrase);

    // Unlocked -> Locked. Drops the key; the verification blob stays on disk.
    void lock();

    // Lock, blank the local verification blob (salt kept), and return to
    // Uninitialized.
    void signOut();

    SessionState state() const;
    bool isSetup() const;
    bool isUnlocked() const;
    const std::string& userId() const { return m_userId; }

    // Base64 salt, when known
    std::optional<std::string> salt() const;

    // Unlocked only (NotUnlocked otherwise)
    EncryptedRecord encryptData(const AnalysisRecord& record) const;
    AnalysisRecord decryptData(const EncryptedRecord& record) const;
    std::vector<HistoryItem> decryptHistory(const std::vector<EncryptedRecord>& records) const;

    // Encrypt and hand to the backend; returns the backend id
    std::string saveRecord(const AnalysisRecord& record);

    // Newest `limit` records from the backend, decrypted
    std::vector<HistoryItem> loadHistory(std::size_t limit);

private:
    SessionState initializeLocked();
    std::vector<std::uint8_t> resolveSalt(const std::string& token);
    void reportAttempt(const std::string& token, bool success);
    std::string token() const;
    void commitUnlocked(SessionState expected,
                        std::unique_ptr<EncryptionManager> key,
                        const std::string& saltB64);

    const std::string  m_userId;
    TokenProvider      m_tokens;
    RemoteBackend&     m_remote;
    KeyMaterialStore&  m_store;
    KdfParams          m_kdf;
    LockoutTracker*    m_tracker;
    Clock              m_clock;
    PassphraseVerifier m_verifier;

    std::mutex m_opMutex;                   // one setup/unlock/lock at a time
    mutable std::mutex m_stateMutex;        // guards everything below
    SessionState m_state = SessionState::Uninitialized;
    std::unique_ptr<EncryptionManager> m_key;
    std::optional<std::string> m_salt;
    bool m_hasCheckedSetup = false;
};
