#pragma once
#include "Clock.hpp"
#include "RemoteBackend.hpp"
#include "SqliteHandle.hpp"

#include <string>

struct BackendPolicy {
    int maxAttempts = 5;
    int lockoutSeconds = 300;
};

// Reference RemoteBackend on a local SQLite file: per-user salt, encrypted
// analyses and the unlock-attempt counter that enforces lockout. The bearer
// token is taken as the user identity.
class SqliteBackend : public RemoteBackend {
public:
    SqliteBackend(const std::string& dbPath, BackendPolicy policy = {}, Clock clock = systemNowMs);

    // Create tables if not present
    void init();

    EncryptionStatus getEncryptionStatus(const std::string& token) override;
    void saveSalt(const std::string& token, const std::string& saltB64) override;
    std::vector<EncryptedRecord> listRecords(const std::string& token, std::size_t limit) override;
    UnlockAttemptStatus getUnlockAttempts(const std::string& token) override;
    UnlockAttemptStatus recordUnlockAttempt(const std::string& token, bool success) override;
    std::string saveRecord(const std::string& token, const EncryptedRecord& record) override;

    // Administrative reset of the attempt counter
    void resetUnlockAttempts(const std::string& userId);

private:
    UnlockAttemptStatus loadAttempts(const std::string& userId);
    void storeAttempts(const std::string& userId, const UnlockAttemptStatus& status);

    SqliteHandle  m_db;
    BackendPolicy m_policy;
    Clock         m_clock;
};
