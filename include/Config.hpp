#pragma once
#include "KeyDerivation.hpp"
#include "LockoutTracker.hpp"
#include "SqliteBackend.hpp"

#include <string>

struct StorageSection {
    std::string keyStore  = "data/keystore.sqlite";
    std::string backendDb = "data/backend.sqlite";
};

struct LogSection {
    int verbosity = 0;      // loguru: -2 error .. 0 info .. 9 max
    std::string file;       // empty = stderr only
};

struct AppConfig {
    StorageSection  storage;
    KdfParams       kdf;
    LockoutSettings lockout;
    BackendPolicy   backend;
    LogSection      log;
};

// INI file:
//   [storage] key_store, backend_db
//   [kdf]     algorithm, iterations, argon2_t_cost, argon2_m_cost_kib, argon2_parallelism
//   [lockout] refresh_interval_ms, cache_ttl_ms
//   [backend] max_attempts, lockout_seconds
//   [log]     verbosity, file
// Unknown keys are ignored; malformed values are reported through `error`.
bool LoadConfig(const std::string& path, AppConfig& out_config, std::string& error);
