#include <catch2/catch_all.hpp>
#include "Encoding.hpp"
#include "EncryptionErrors.hpp"
#include "EncryptionManager.hpp"
#include "EncryptionSession.hpp"
#include "KeyMaterialStore.hpp"
#include "LockoutCache.hpp"
#include "LockoutTracker.hpp"
#include "RecordCodec.hpp"
#include "test_support.hpp"

#include <memory>

namespace {
    const std::string kUser = "auth0|alice";
    const std::string kPass = "correct-horse-battery";

    KdfParams fast_kdf() {
        KdfParams p;
        p.iterations = 1000;
        return p;
    }

    TokenProvider token_for(const std::string& user) {
        return [user] { return user; };
    }

    // One device: its own key-material file, talking to a shared backend
    struct Device {
        Device(const std::string& dbName, FakeBackend& backend, ManualClock& clock)
            : db(dbName), store(db.path) {
            store.init();
            session = std::make_unique<EncryptionSession>(
                kUser, token_for(kUser), backend, store, fast_kdf(), nullptr, clock.fn());
        }

        TempDb db;
        KeyMaterialStore store;
        std::unique_ptr<EncryptionSession> session;
    };
}

TEST_CASE("Session: first-time setup", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    Device dev("tmp_test_session_setup.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;

    REQUIRE(s.state() == SessionState::Uninitialized);
    REQUIRE(s.initialize() == SessionState::NotSetup);
    REQUIRE_FALSE(s.isSetup());

    s.setup(kPass);
    REQUIRE(s.state() == SessionState::Unlocked);
    REQUIRE(s.isUnlocked());
    REQUIRE(s.isSetup());

    // Salt: 16 random bytes, same value remotely, locally and in the session
    REQUIRE(backend.salt.has_value());
    REQUIRE(fromBase64(*backend.salt).size() == 16);
    REQUIRE(dev.store.loadSalt(kUser) == backend.salt);
    REQUIRE(s.salt() == backend.salt);

    // Verification blob opens under the derived key
    REQUIRE(dev.store.has(kUser));
    EncryptionManager key(KeyDerivation::deriveKey(kPass, fromBase64(*backend.salt), fast_kdf()));
    auto payload = nlohmann::json::parse(key.open(*dev.store.get(kUser)));
    REQUIRE(payload["userId"] == kUser);

    // Setup is one-shot
    REQUIRE_THROWS_AS(s.setup(kPass), InvalidState);
}

TEST_CASE("Session: encrypt/decrypt while unlocked", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    Device dev("tmp_test_session_data.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;
    s.initialize();
    s.setup(kPass);

    AnalysisRecord rec = sampleRecord();
    EncryptedRecord sealed = s.encryptData(rec);
    REQUIRE(sealed.userEmail != rec.userEmail);
    REQUIRE(s.decryptData(sealed) == rec);

    std::string id = s.saveRecord(rec);
    auto history = s.loadHistory(10);
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].decrypted);
    REQUIRE(history[0].record.id == id);
    REQUIRE(history[0].record.inputContent == rec.inputContent);

    s.lock();
    REQUIRE(s.state() == SessionState::Locked);
    REQUIRE_THROWS_AS(s.encryptData(rec), NotUnlocked);
    REQUIRE_THROWS_AS(s.decryptData(sealed), NotUnlocked);
    REQUIRE_THROWS_WITH(s.loadHistory(10), "Encryption not unlocked");
}

TEST_CASE("Session: unlock with right and wrong passphrase", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    Device dev("tmp_test_session_unlock.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;
    s.initialize();
    s.setup(kPass);
    s.lock();

    REQUIRE_THROWS_AS(s.unlock("wrong-horse-battery"), InvalidPassphrase);
    REQUIRE(s.state() == SessionState::Locked);
    REQUIRE(backend.reported == std::vector<bool>{ false });
    REQUIRE(backend.unlock.attempts == 1);

    REQUIRE_NOTHROW(s.unlock(kPass));
    REQUIRE(s.state() == SessionState::Unlocked);
    REQUIRE(backend.reported == std::vector<bool>{ false, true });
    REQUIRE(backend.unlock.attempts == 0);

    // Already unlocked: refused whatever the passphrase
    REQUIRE_THROWS_AS(s.unlock(kPass), InvalidState);
    REQUIRE_THROWS_AS(s.unlock("wrong-horse-battery"), InvalidState);
    REQUIRE(s.isUnlocked());
    REQUIRE(backend.reported.size() == 2);
}

TEST_CASE("Session: data sealed before lock opens after unlock", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    Device dev("tmp_test_session_relock.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;
    s.initialize();
    s.setup(kPass);

    AnalysisRecord rec = sampleRecord();
    EncryptedRecord before = s.encryptData(rec);

    s.lock();
    REQUIRE(s.state() == SessionState::Locked);
    s.unlock(kPass);
    REQUIRE(s.state() == SessionState::Unlocked);

    REQUIRE(s.decryptData(before) == rec);

    AnalysisRecord other = sampleRecord();
    other.inputType = "eml";
    other.inputContent = "From: billing@paypa1.example\r\nSubject: Verify now";
    other.mlResult = MlResult{ false, 0.12 };
    other.analysisContext.reset();
    EncryptedRecord after = s.encryptData(other);
    REQUIRE(s.decryptData(after) == other);
}

TEST_CASE("Session: second device unlocks against a backend record", "[session]") {
    FakeBackend backend;
    ManualClock clock;

    Device laptop("tmp_test_session_laptop.sqlite", backend, clock);
    laptop.session->initialize();
    laptop.session->setup(kPass);
    laptop.session->saveRecord(sampleRecord());

    Device phone("tmp_test_session_phone.sqlite", backend, clock);
    EncryptionSession& s = *phone.session;
    REQUIRE(s.initialize() == SessionState::Locked);
    REQUIRE(phone.store.loadSalt(kUser) == backend.salt);
    REQUIRE_FALSE(phone.store.has(kUser));

    REQUIRE_THROWS_AS(s.unlock("not-the-passphrase"), InvalidPassphrase);
    REQUIRE_FALSE(phone.store.has(kUser));

    s.unlock(kPass);
    REQUIRE(s.isUnlocked());
    REQUIRE(phone.store.has(kUser));

    // Data written on one device opens on the other
    auto history = s.loadHistory(10);
    REQUIRE(history.size() == 1);
    REQUIRE(history[0].decrypted);
    REQUIRE(history[0].record.userEmail == sampleRecord().userEmail);
}

TEST_CASE("Session: unlock initializes on demand", "[session]") {
    FakeBackend backend;
    ManualClock clock;

    Device laptop("tmp_test_session_lazy_a.sqlite", backend, clock);
    laptop.session->initialize();
    laptop.session->setup(kPass);

    Device other("tmp_test_session_lazy_b.sqlite", backend, clock);
    REQUIRE(other.session->state() == SessionState::Uninitialized);
    other.session->unlock(kPass);
    REQUIRE(other.session->isUnlocked());
}

TEST_CASE("Session: records without a salt disable encryption", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    EncryptionManager stray(std::vector<std::uint8_t>(32, 0x01));
    backend.records.push_back(encryptRecord(sampleRecord(), stray));

    Device dev("tmp_test_session_error.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;
    REQUIRE(s.initialize() == SessionState::Error);
    REQUIRE_THROWS_AS(s.setup(kPass), DataInconsistency);
    REQUIRE_THROWS_AS(s.unlock(kPass), DataInconsistency);
    REQUIRE_FALSE(backend.salt.has_value());
    REQUIRE(backend.saveSaltCalls == 0);
}

TEST_CASE("Session: backend lockout refuses before any key work", "[session][lockout]") {
    FakeBackend backend;
    ManualClock clock;
    backend.clock = clock.fn();
    Device dev("tmp_test_session_locked.sqlite", backend, clock);

    TempDb cacheDb("tmp_test_session_locked_cache.sqlite");
    LockoutCache cache(cacheDb.path);
    cache.init();
    LockoutTracker tracker(backend, token_for(kUser), cache, nullptr, {}, clock.fn());
    EncryptionSession s(kUser, token_for(kUser), backend, dev.store, fast_kdf(), &tracker, clock.fn());

    s.initialize();
    s.setup(kPass);
    s.lock();

    backend.unlock = UnlockAttemptStatus{ 5, clock.nowMs + 90500 };
    const int listBefore = backend.listCalls;
    try {
        s.unlock(kPass);
        FAIL("unlock should have been refused");
    } catch (const LockedOut& ex) {
        REQUIRE(ex.remainingSeconds() == 91);
    }
    REQUIRE(s.state() == SessionState::Locked);
    REQUIRE(backend.reported.empty());
    REQUIRE(backend.listCalls == listBefore);

    LockoutStatus st = tracker.status(kUser);
    REQUIRE(st.isLocked);
    REQUIRE(st.attempts == 5);

    // After expiry the right passphrase works again
    clock.advance(90500);
    backend.unlock = UnlockAttemptStatus{};
    s.unlock(kPass);
    REQUIRE(s.isUnlocked());
    REQUIRE_FALSE(tracker.status(kUser).isLocked);
}

TEST_CASE("Session: fifth wrong passphrase triggers lockout", "[session][lockout]") {
    FakeBackend backend;
    ManualClock clock;
    backend.clock = clock.fn();
    Device dev("tmp_test_session_fifth.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;
    s.initialize();
    s.setup(kPass);
    s.lock();

    for (int i = 0; i < 5; ++i) {
        REQUIRE_THROWS_AS(s.unlock("guess-" + std::to_string(i)), InvalidPassphrase);
    }
    REQUIRE(backend.unlock.lockedUntil.has_value());
    REQUIRE_THROWS_AS(s.unlock(kPass), LockedOut);
    REQUIRE(s.state() == SessionState::Locked);
}

TEST_CASE("Session: verification outage is not a failed attempt", "[session]") {
    FakeBackend backend;
    ManualClock clock;

    Device laptop("tmp_test_session_outage_a.sqlite", backend, clock);
    laptop.session->initialize();
    laptop.session->setup(kPass);
    laptop.session->saveRecord(sampleRecord());

    Device phone("tmp_test_session_outage_b.sqlite", backend, clock);
    phone.session->initialize();

    backend.failList = true;
    REQUIRE_THROWS_AS(phone.session->unlock(kPass), VerificationUnavailable);
    REQUIRE(phone.session->state() == SessionState::Locked);
    REQUIRE(backend.reported.empty());

    backend.failList = false;
    backend.failAttempts = true;
    REQUIRE_THROWS_AS(phone.session->unlock(kPass), VerificationUnavailable);
    REQUIRE(backend.reported.empty());
}

TEST_CASE("Session: initialize needs the backend when nothing is local", "[session]") {
    FakeBackend backend;
    backend.failStatus = true;
    ManualClock clock;
    Device dev("tmp_test_session_init_down.sqlite", backend, clock);

    REQUIRE_THROWS_AS(dev.session->initialize(), VerificationUnavailable);
    REQUIRE(dev.session->state() == SessionState::Uninitialized);
}

TEST_CASE("Session: setup leaves nothing behind when the backend refuses", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    Device dev("tmp_test_session_setup_down.sqlite", backend, clock);
    dev.session->initialize();

    backend.failSaveSalt = true;
    REQUIRE_THROWS_AS(dev.session->setup(kPass), RemoteUnavailable);
    REQUIRE(dev.session->state() == SessionState::NotSetup);
    REQUIRE_FALSE(dev.store.loadSalt(kUser).has_value());
    REQUIRE_FALSE(dev.store.has(kUser));

    backend.failSaveSalt = false;
    REQUIRE_NOTHROW(dev.session->setup(kPass));
}

TEST_CASE("Session: sign-out drops key and verification blob", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    Device dev("tmp_test_session_signout.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;
    s.initialize();
    s.setup(kPass);

    s.lock();
    // Locking keeps the blob for the next local unlock
    REQUIRE(dev.store.has(kUser));

    s.unlock(kPass);
    s.signOut();
    REQUIRE(s.state() == SessionState::Uninitialized);
    REQUIRE_FALSE(s.isUnlocked());
    REQUIRE_FALSE(dev.store.has(kUser));
    REQUIRE(dev.store.loadSalt(kUser).has_value());
    REQUIRE_THROWS_AS(s.encryptData(sampleRecord()), NotUnlocked);

    // Signing back in finds the backend salt
    REQUIRE(s.initialize() == SessionState::Locked);
}

TEST_CASE("Session: history keeps undecryptable records as placeholders", "[session]") {
    FakeBackend backend;
    ManualClock clock;
    Device dev("tmp_test_session_history.sqlite", backend, clock);
    EncryptionSession& s = *dev.session;
    s.initialize();
    s.setup(kPass);

    EncryptedRecord good = s.encryptData(sampleRecord());
    good.id = "1";
    EncryptionManager foreign(std::vector<std::uint8_t>(32, 0x77));
    EncryptedRecord bad = encryptRecord(sampleRecord(), foreign);
    bad.id = "2";
    bad.inputType = "eml";

    auto items = s.decryptHistory({ good, bad });
    REQUIRE(items.size() == 2);
    REQUIRE(items[0].decrypted);
    REQUIRE(items[0].record.userEmail == "alice@example.com");

    REQUIRE_FALSE(items[1].decrypted);
    REQUIRE(items[1].record.id == "2");
    REQUIRE(items[1].record.inputType == "eml");
    REQUIRE(items[1].record.userEmail == "[Encrypted]");
    REQUIRE(items[1].record.inputContent == "[Decryption failed]");
    REQUIRE(items[1].record.mlResult == std::optional<MlResult>(MlResult{}));
}

TEST_CASE("Session: state names", "[session]") {
    REQUIRE(std::string(sessionStateName(SessionState::NotSetup)) == "not-setup");
    REQUIRE(std::string(sessionStateName(SessionState::Unlocked)) == "unlocked");

    FakeBackend backend;
    KeyMaterialStore store(":memory:");
    REQUIRE_THROWS_AS(EncryptionSession("", token_for(""), backend, store), std::invalid_argument);
}
