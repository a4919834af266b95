#pragma once
#include "Clock.hpp"
#include "EncryptionErrors.hpp"
#include "RemoteBackend.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Scratch SQLite file, removed before and after the test.
struct TempDb {
    explicit TempDb(std::string name) : path(std::move(name)) {
        std::filesystem::remove(path);
    }
    ~TempDb() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    TempDb(const TempDb&) = delete;
    TempDb& operator=(const TempDb&) = delete;

    std::string path;
};

// Hand-driven time source
struct ManualClock {
    std::int64_t nowMs = 1700000000000;

    Clock fn() {
        return [this] { return nowMs; };
    }
    void advance(std::int64_t ms) { nowMs += ms; }
};

// In-memory RemoteBackend with switchable failures and call counters.
class FakeBackend : public RemoteBackend {
public:
    std::optional<std::string> salt;
    std::vector<EncryptedRecord> records;   // newest first
    UnlockAttemptStatus unlock;
    int maxAttempts = 5;
    std::int64_t lockoutMs = 300000;
    Clock clock = systemNowMs;

    bool failStatus = false;
    bool failSaveSalt = false;
    bool failList = false;
    bool failAttempts = false;
    bool failRecordAttempt = false;

    int statusCalls = 0;
    int saveSaltCalls = 0;
    int listCalls = 0;
    int attemptsCalls = 0;
    std::vector<bool> reported;

    EncryptionStatus getEncryptionStatus(const std::string&) override {
        ++statusCalls;
        if (failStatus) throw RemoteUnavailable("status: backend down");
        EncryptionStatus s;
        s.hasSalt = salt.has_value();
        s.salt = salt;
        s.hasAnalyses = !records.empty();
        return s;
    }

    void saveSalt(const std::string&, const std::string& saltB64) override {
        ++saveSaltCalls;
        if (failSaveSalt) throw RemoteUnavailable("saveSalt: backend down");
        if (salt && *salt != saltB64) throw RemoteUnavailable("Failed to save salt: salt already set");
        salt = saltB64;
    }

    std::vector<EncryptedRecord> listRecords(const std::string&, std::size_t limit) override {
        ++listCalls;
        if (failList) throw RemoteUnavailable("list: backend down");
        std::vector<EncryptedRecord> out;
        for (std::size_t i = 0; i < records.size() && i < limit; ++i) out.push_back(records[i]);
        return out;
    }

    UnlockAttemptStatus getUnlockAttempts(const std::string&) override {
        ++attemptsCalls;
        if (failAttempts) throw RemoteUnavailable("attempts: backend down");
        return unlock;
    }

    UnlockAttemptStatus recordUnlockAttempt(const std::string&, bool success) override {
        if (failRecordAttempt) throw RemoteUnavailable("record attempt: backend down");
        reported.push_back(success);
        if (success) {
            unlock = UnlockAttemptStatus{};
        } else {
            ++unlock.attempts;
            if (unlock.attempts >= maxAttempts) unlock.lockedUntil = clock() + lockoutMs;
        }
        return unlock;
    }

    std::string saveRecord(const std::string&, const EncryptedRecord& record) override {
        EncryptedRecord r = record;
        r.id = std::to_string(records.size() + 1);
        records.insert(records.begin(), r);
        return r.id;
    }
};

inline AnalysisRecord sampleRecord() {
    AnalysisRecord r;
    r.userEmail    = "alice@example.com";
    r.inputContent = "http://paypa1-login.example.net/verify";
    r.inputType    = "url";
    r.mlResult     = MlResult{ true, 0.97 };
    r.analysisContext = nlohmann::json{ {"source", "browser"}, {"score", 42} };
    r.createdAt    = "2024-05-01T10:00:00Z";
    r.updatedAt    = "2024-05-01T10:00:00Z";
    return r;
}
