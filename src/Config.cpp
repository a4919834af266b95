#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

std::string Trim(const std::string& input) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(input.begin(), input.end(), is_space);
    auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string StripInlineComment(const std::string& input) {
    for (std::size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if ((ch == '#' || ch == ';') &&
            (i == 0 || std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
            return Trim(input.substr(0, i));
        }
    }
    return input;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    char* end_ptr = nullptr;
    const unsigned long value = std::strtoul(text.c_str(), &end_ptr, 10);
    if (end_ptr == text.c_str() || *end_ptr != '\0' || value > 0xFFFFFFFFul) {
        return false;
    }
    out = static_cast<std::uint32_t>(value);
    return true;
}

bool ParseInt(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    char* end_ptr = nullptr;
    errno = 0;
    const long value = std::strtol(text.c_str(), &end_ptr, 10);
    if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE ||
        value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool ParseInt64(const std::string& text, std::int64_t& out) {
    if (text.empty()) {
        return false;
    }
    char* end_ptr = nullptr;
    errno = 0;
    const long long value = std::strtoll(text.c_str(), &end_ptr, 10);
    if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE) {
        return false;
    }
    out = static_cast<std::int64_t>(value);
    return true;
}

struct IniState {
    std::string section;
    AppConfig* cfg{nullptr};
};

// Returns false when a known key carries a value that does not parse.
bool ApplyKV(IniState& state, const std::string& key, const std::string& value) {
    AppConfig& cfg = *state.cfg;
    if (state.section == "storage") {
        if (key == "key_store") {
            cfg.storage.keyStore = value;
        } else if (key == "backend_db") {
            cfg.storage.backendDb = value;
        }
        return true;
    }
    if (state.section == "kdf") {
        if (key == "algorithm") {
            try {
                cfg.kdf.algorithm = parseKdfAlgorithm(value);
            } catch (const std::invalid_argument&) {
                return false;
            }
            return true;
        }
        if (key == "iterations")         return ParseUint32(value, cfg.kdf.iterations);
        if (key == "argon2_t_cost")      return ParseUint32(value, cfg.kdf.argon2TCost);
        if (key == "argon2_m_cost_kib")  return ParseUint32(value, cfg.kdf.argon2MCostKiB);
        if (key == "argon2_parallelism") return ParseUint32(value, cfg.kdf.argon2Parallelism);
        return true;
    }
    if (state.section == "lockout") {
        if (key == "refresh_interval_ms") return ParseInt64(value, cfg.lockout.refreshIntervalMs);
        if (key == "cache_ttl_ms")        return ParseInt64(value, cfg.lockout.cacheTtlMs);
        return true;
    }
    if (state.section == "backend") {
        if (key == "max_attempts")    return ParseInt(value, cfg.backend.maxAttempts);
        if (key == "lockout_seconds") return ParseInt(value, cfg.backend.lockoutSeconds);
        return true;
    }
    if (state.section == "log") {
        if (key == "verbosity") return ParseInt(value, cfg.log.verbosity);
        if (key == "file") {
            cfg.log.file = value;
        }
        return true;
    }
    return true;
}

bool ParseIni(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "config file not found: " + path;
        return false;
    }

    IniState state;
    state.cfg = &out;

    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        const std::string trimmed = StripInlineComment(Trim(line));
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']') {
            state.section = Trim(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        const auto pos = trimmed.find('=');
        if (pos == std::string::npos) {
            std::ostringstream oss;
            oss << "invalid line " << line_no;
            error = oss.str();
            return false;
        }
        std::string key = Trim(trimmed.substr(0, pos));
        std::string value = Trim(trimmed.substr(pos + 1));
        if (!ApplyKV(state, key, value)) {
            std::ostringstream oss;
            oss << "invalid value for " << state.section << "." << key << " on line " << line_no;
            error = oss.str();
            return false;
        }
    }
    return true;
}

}  // namespace

bool LoadConfig(const std::string& path, AppConfig& out_config, std::string& error) {
    out_config = AppConfig{};
    if (!ParseIni(path, out_config, error)) {
        return false;
    }
    if (out_config.kdf.algorithm == KdfAlgorithm::Pbkdf2Sha256 && out_config.kdf.iterations == 0) {
        error = "kdf.iterations must be positive";
        return false;
    }
    if (out_config.kdf.iterations > static_cast<std::uint32_t>(std::numeric_limits<int>::max())) {
        error = "kdf.iterations out of range";
        return false;
    }
    if (out_config.backend.maxAttempts <= 0 || out_config.backend.lockoutSeconds <= 0) {
        error = "backend.max_attempts and backend.lockout_seconds must be positive";
        return false;
    }
    if (out_config.lockout.refreshIntervalMs < 0 || out_config.lockout.cacheTtlMs < 0) {
        error = "lockout intervals must not be negative";
        return false;
    }
    if (out_config.storage.keyStore.empty() || out_config.storage.backendDb.empty()) {
        error = "storage paths missing";
        return false;
    }
    return true;
}
