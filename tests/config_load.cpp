#include <catch2/catch_all.hpp>
#include "Config.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace {
    struct TempIni {
        TempIni(std::string name, const std::string& body) : path(std::move(name)) {
            std::ofstream out(path, std::ios::trunc);
            out << body;
        }
        ~TempIni() {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
        std::string path;
    };
}

TEST_CASE("Config: full file is parsed", "[config]") {
    TempIni ini("tmp_test_full.ini",
        "# zkvault settings\n"
        "[storage]\n"
        "key_store = /var/lib/zkvault/keys.sqlite\n"
        "backend_db = /var/lib/zkvault/backend.sqlite   ; shared\n"
        "\n"
        "[kdf]\n"
        "algorithm = argon2id\n"
        "iterations = 200000\n"
        "argon2_t_cost = 4\n"
        "argon2_m_cost_kib = 131072\n"
        "argon2_parallelism = 2\n"
        "\n"
        "[lockout]\n"
        "refresh_interval_ms = 500\n"
        "cache_ttl_ms = 30000\n"
        "\n"
        "[backend]\n"
        "max_attempts = 3\n"
        "lockout_seconds = 600\n"
        "\n"
        "[log]\n"
        "verbosity = 1\n"
        "file = zkvault.log\n");

    AppConfig cfg;
    std::string err;
    REQUIRE(LoadConfig(ini.path, cfg, err));
    CHECK(cfg.storage.keyStore == "/var/lib/zkvault/keys.sqlite");
    CHECK(cfg.storage.backendDb == "/var/lib/zkvault/backend.sqlite");
    CHECK(cfg.kdf.algorithm == KdfAlgorithm::Argon2id);
    CHECK(cfg.kdf.iterations == 200000);
    CHECK(cfg.kdf.argon2TCost == 4);
    CHECK(cfg.kdf.argon2MCostKiB == 131072);
    CHECK(cfg.kdf.argon2Parallelism == 2);
    CHECK(cfg.lockout.refreshIntervalMs == 500);
    CHECK(cfg.lockout.cacheTtlMs == 30000);
    CHECK(cfg.backend.maxAttempts == 3);
    CHECK(cfg.backend.lockoutSeconds == 600);
    CHECK(cfg.log.verbosity == 1);
    CHECK(cfg.log.file == "zkvault.log");
}

TEST_CASE("Config: defaults for missing sections and unknown keys", "[config]") {
    TempIni ini("tmp_test_partial.ini",
        "[kdf]\n"
        "iterations = 150000\n"
        "pepper = ignored\n"
        "[unknown]\n"
        "anything = goes\n");

    AppConfig cfg;
    std::string err;
    REQUIRE(LoadConfig(ini.path, cfg, err));
    CHECK(cfg.kdf.algorithm == KdfAlgorithm::Pbkdf2Sha256);
    CHECK(cfg.kdf.iterations == 150000);
    CHECK(cfg.storage.keyStore == "data/keystore.sqlite");
    CHECK(cfg.backend.maxAttempts == 5);
    CHECK(cfg.backend.lockoutSeconds == 300);
    CHECK(cfg.lockout.refreshIntervalMs == 1000);
    CHECK(cfg.lockout.cacheTtlMs == 60000);
}

TEST_CASE("Config: malformed values are reported", "[config]") {
    AppConfig cfg;
    std::string err;

    TempIni badNumber("tmp_test_badnum.ini", "[backend]\nmax_attempts = five\n");
    REQUIRE_FALSE(LoadConfig(badNumber.path, cfg, err));
    CHECK(err.find("backend.max_attempts") != std::string::npos);

    TempIni badAlgo("tmp_test_badalgo.ini", "[kdf]\nalgorithm = md5\n");
    REQUIRE_FALSE(LoadConfig(badAlgo.path, cfg, err));
    CHECK(err.find("kdf.algorithm") != std::string::npos);

    TempIni negative("tmp_test_negative.ini", "[kdf]\niterations = -1\n");
    REQUIRE_FALSE(LoadConfig(negative.path, cfg, err));

    TempIni noEquals("tmp_test_noeq.ini", "[storage]\nkey_store\n");
    REQUIRE_FALSE(LoadConfig(noEquals.path, cfg, err));
    CHECK(err == "invalid line 2");
}

TEST_CASE("Config: values are validated", "[config]") {
    AppConfig cfg;
    std::string err;

    TempIni zeroIter("tmp_test_zeroiter.ini", "[kdf]\niterations = 0\n");
    REQUIRE_FALSE(LoadConfig(zeroIter.path, cfg, err));
    CHECK(err == "kdf.iterations must be positive");

    TempIni zeroLock("tmp_test_zerolock.ini", "[backend]\nlockout_seconds = 0\n");
    REQUIRE_FALSE(LoadConfig(zeroLock.path, cfg, err));

    TempIni emptyPath("tmp_test_emptypath.ini", "[storage]\nkey_store =\n");
    REQUIRE_FALSE(LoadConfig(emptyPath.path, cfg, err));
    CHECK(err == "storage paths missing");
}

TEST_CASE("Config: numbers outside their range are rejected", "[config]") {
    AppConfig cfg;
    std::string err;

    // Fits in 32 bits but not in the int the KDF takes
    TempIni bigIter("tmp_test_bigiter.ini", "[kdf]\niterations = 3000000000\n");
    REQUIRE_FALSE(LoadConfig(bigIter.path, cfg, err));
    CHECK(err == "kdf.iterations out of range");

    TempIni maxIter("tmp_test_maxiter.ini", "[kdf]\niterations = 2147483647\n");
    REQUIRE(LoadConfig(maxIter.path, cfg, err));
    CHECK(cfg.kdf.iterations == 2147483647u);

    TempIni bigInt("tmp_test_bigint.ini", "[backend]\nmax_attempts = 4294967301\n");
    REQUIRE_FALSE(LoadConfig(bigInt.path, cfg, err));
    CHECK(err.find("backend.max_attempts") != std::string::npos);

    TempIni bigMs("tmp_test_bigms.ini", "[lockout]\ncache_ttl_ms = 99999999999999999999\n");
    REQUIRE_FALSE(LoadConfig(bigMs.path, cfg, err));
    CHECK(err.find("lockout.cache_ttl_ms") != std::string::npos);
}

TEST_CASE("Config: missing file", "[config]") {
    AppConfig cfg;
    std::string err;
    REQUIRE_FALSE(LoadConfig("does_not_exist.ini", cfg, err));
    CHECK(err.find("does_not_exist.ini") != std::string::npos);
}
