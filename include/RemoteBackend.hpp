#pragma once
#include "AnalysisRecord.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

struct EncryptionStatus {
    bool hasSalt = false;
    bool hasAnalyses = false;
    std::optional<std::string> salt;           // base64
};

struct UnlockAttemptStatus {
    int attempts = 0;
    std::optional<std::int64_t> lockedUntil;   // ms since epoch
};

// Yields the bearer credential for the signed-in user (identity provider is external).
using TokenProvider = std::function<std::string()>;

// The remote backend as seen by the encryption core. It only ever receives
// salts and ciphertext. Every method throws RemoteUnavailable when the
// backend cannot be reached or answers with an error.
class RemoteBackend {
public:
    virtual ~RemoteBackend() = default;

    virtual EncryptionStatus getEncryptionStatus(const std::string& token) = 0;

    virtual void saveSalt(const std::string& token, const std::string& saltB64) = 0;

    // Newest first, at most `limit` records
    virtual std::vector<EncryptedRecord> listRecords(const std::string& token,
                                                     std::size_t limit) = 0;

    virtual UnlockAttemptStatus getUnlockAttempts(const std::string& token) = 0;

    // Reports the outcome of a verified unlock; returns the new counter state.
    virtual UnlockAttemptStatus recordUnlockAttempt(const std::string& token, bool success) = 0;

    // Returns the id assigned by the backend
    virtual std::string saveRecord(const std::string& token, const EncryptedRecord& record) = 0;
};
