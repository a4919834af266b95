// src/main.cpp
#include "Config.hpp"
#include "EncryptionErrors.hpp"
#include "EncryptionSession.hpp"
#include "KeyMaterialStore.hpp"
#include "LockoutCache.hpp"
#include "LockoutChannel.hpp"
#include "LockoutTracker.hpp"
#include "Logging.hpp"
#include "SqliteBackend.hpp"
#include "console_io.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <cstring>
#include <stdexcept>

// ----- Small helpers -----

static void scrub(std::string& s) {
    std::fill(s.begin(), s.end(), '\0');
    s.clear();
}

static void ensure_parent_dir(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
}

static void print_usage(const char* argv0) {
    std::cout << "usage: " << argv0 << " --user <id> [--config <file.ini>]\n";
}

static void print_item(const HistoryItem& item) {
    const auto& r = item.record;
    std::cout << "  [" << r.id << "] " << r.inputType
              << "  created=" << r.createdAt;
    if (!item.decrypted) {
        std::cout << "  " << r.userEmail << " " << r.inputContent << "\n";
        return;
    }
    std::cout << "  email=" << r.userEmail;
    if (r.mlResult) {
        std::cout << "  phishing=" << (r.mlResult->isPhishing ? "yes" : "no")
                  << " (p=" << r.mlResult->phishingProbability << ")";
    }
    std::cout << "\n      " << r.inputContent << "\n";
    if (r.analysisContext) {
        std::cout << "      context: " << r.analysisContext->dump() << "\n";
    }
}

// ----- Menu actions -----

static void action_setup(EncryptionSession& session) {
    std::string pw1 = prompt_passphrase("New encryption passphrase: ");
    std::string pw2 = prompt_passphrase("Confirm passphrase: ");
    if (pw1.empty() || pw1 != pw2) {
        std::cout << "Passphrases empty or do not match.\n";
        scrub(pw1);
        scrub(pw2);
        return;
    }
    try {
        session.setup(pw1);
        std::cout << "Encryption set up and unlocked.\n";
    } catch (const std::exception& ex) {
        std::cout << "Setup failed: " << ex.what() << "\n";
    }
    scrub(pw1);
    scrub(pw2);
}

static void action_unlock(EncryptionSession& session) {
    std::string pw = prompt_passphrase("Encryption passphrase: ");
    try {
        session.unlock(pw);
        std::cout << "Encryption unlocked.\n";
    } catch (const InvalidPassphrase& ex) {
        std::cout << ex.what() << "\n";
    } catch (const LockedOut& ex) {
        std::cout << ex.what() << "\n";
    } catch (const VerificationUnavailable& ex) {
        std::cout << ex.what() << " (nothing was counted against you)\n";
    } catch (const std::exception& ex) {
        std::cout << "Unlock failed: " << ex.what() << "\n";
    }
    scrub(pw);
}

static void action_save(EncryptionSession& session, const std::string& userId) {
    AnalysisRecord rec;
    rec.userEmail    = userId;
    rec.inputType    = prompt_line("Input type (url/eml/header): ");
    rec.inputContent = prompt_line("Input content: ");

    const std::string verdict = prompt_line("Is phishing? (y/N): ");
    MlResult ml;
    ml.isPhishing = !verdict.empty() && (verdict[0] == 'y' || verdict[0] == 'Y');
    try {
        ml.phishingProbability = std::stod(prompt_line("Phishing probability (0..1): "));
    } catch (const std::exception&) {
        std::cout << "Invalid probability.\n";
        return;
    }
    rec.mlResult = ml;

    const std::string ctx = prompt_line("Analysis context JSON (optional): ");
    if (!ctx.empty()) {
        auto parsed = nlohmann::json::parse(ctx, nullptr, false);
        if (parsed.is_discarded()) {
            std::cout << "Context is not valid JSON.\n";
            return;
        }
        rec.analysisContext = std::move(parsed);
    }

    try {
        std::string id = session.saveRecord(rec);
        std::cout << "Saved encrypted analysis " << id << ".\n";
    } catch (const std::exception& ex) {
        std::cout << "Save failed: " << ex.what() << "\n";
    }
}

static void action_history(EncryptionSession& session) {
    try {
        auto items = session.loadHistory(50);
        if (items.empty()) {
            std::cout << "No analyses stored.\n";
            return;
        }
        for (const auto& item : items) print_item(item);
    } catch (const NotUnlocked&) {
        std::cout << "Encryption not unlocked. Please unlock encryption to view history.\n";
    } catch (const std::exception& ex) {
        std::cout << "Failed to load history: " << ex.what() << "\n";
    }
}

static void action_export(RemoteBackend& backend, const std::string& token) {
    try {
        nlohmann::json out = backend.listRecords(token, 1000);
        std::cout << out.dump(2) << "\n";
    } catch (const std::exception& ex) {
        std::cout << "Export failed: " << ex.what() << "\n";
    }
}

static void action_lockout_status(LockoutTracker& tracker, const std::string& userId) {
    tracker.refresh(userId);
    LockoutStatus st = tracker.status(userId);
    std::cout << "  failed attempts: " << st.attempts << "\n";
    if (st.isLocked) {
        std::cout << "  locked, " << st.remainingSeconds << "s remaining\n";
    } else {
        std::cout << "  not locked\n";
    }
}

// ----- Main -----

int main(int argc, char* argv[]) {
    std::string userId;
    std::string configPath = "zkvault.ini";
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--user") == 0 && i + 1 < argc) {
            userId = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
    }
    if (userId.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    AppConfig cfg;
    std::string cfgError;
    const bool cfgLoaded = LoadConfig(configPath, cfg, cfgError);
    if (!cfgLoaded) cfg = AppConfig{};
    initLogging(argc, argv, cfg.log);
    if (!cfgLoaded) {
        LOG_F(WARNING, "Using default configuration: %s", cfgError.c_str());
    }

    try {
        ensure_parent_dir(cfg.storage.keyStore);
        ensure_parent_dir(cfg.storage.backendDb);

        KeyMaterialStore store(cfg.storage.keyStore);
        store.init();
        LockoutCache lockoutCache(cfg.storage.keyStore);
        lockoutCache.init();

        SqliteBackend backend(cfg.storage.backendDb, cfg.backend);
        backend.init();

        // The identity provider is out of scope: the user id doubles as the token
        TokenProvider tokens = [userId] { return userId; };

        InProcessLockoutChannel channel;
        LockoutTracker tracker(backend, tokens, lockoutCache, &channel, cfg.lockout);
        EncryptionSession session(userId, tokens, backend, store, cfg.kdf, &tracker);

        SessionState st = session.initialize();
        std::cout << "Signed in as " << userId << " (encryption " << sessionStateName(st) << ")\n";
        if (st == SessionState::Error) {
            std::cout << "Your account has encrypted data but no salt. Encryption is disabled.\n";
        }

        for (;;) {
            std::cout << "\n=== Menu (" << sessionStateName(session.state()) << ") ===\n"
                         "1) Set up encryption\n"
                         "2) Unlock\n"
                         "3) Lock\n"
                         "4) Save analysis\n"
                         "5) View history\n"
                         "6) Export encrypted history (JSON)\n"
                         "7) Unlock-attempt status\n"
                         "8) Sign out\n"
                         "q) Quit\n";
            std::string choice = prompt_line("> ");
            if (!std::cin) break;

            if (choice == "1") action_setup(session);
            else if (choice == "2") action_unlock(session);
            else if (choice == "3") { session.lock(); std::cout << "Locked.\n"; }
            else if (choice == "4") action_save(session, userId);
            else if (choice == "5") action_history(session);
            else if (choice == "6") action_export(backend, tokens());
            else if (choice == "7") action_lockout_status(tracker, userId);
            else if (choice == "8") {
                session.signOut();
                std::cout << "Signed out.\n";
                break;
            }
            else if (choice == "q" || choice == "Q") break;
            else std::cout << "Unknown option.\n";
        }

        session.lock();
        return 0;
    } catch (const std::exception& ex) {
        LOG_F(ERROR, "Fatal: %s", ex.what());
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
