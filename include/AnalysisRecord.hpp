#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Classifier verdict attached to an analysis.
struct MlResult {
    bool   isPhishing = false;
    double phishingProbability = 0.0;   // 0..1
};

// Plaintext analysis as the application sees it.
struct AnalysisRecord {
    std::string id;
    std::string userEmail;
    std::string inputContent;
    std::optional<nlohmann::json> analysisContext;
    std::optional<MlResult> mlResult;
    std::string inputType;              // "url", "eml", "header", ...
    std::string createdAt;              // ISO-8601 (UTC)
    std::string updatedAt;
};

// Same record as stored remotely: sensitive fields are serialized sealed
// pairs, listing metadata stays in the clear.
struct EncryptedRecord {
    std::string id;
    std::string userEmail;
    std::string inputContent;
    std::optional<std::string> analysisContext;
    std::string mlResult;
    std::string inputType;
    std::string createdAt;
    std::string updatedAt;
};

bool operator==(const MlResult& a, const MlResult& b);
// An analysisContext holding JSON null compares equal to an absent one
bool operator==(const AnalysisRecord& a, const AnalysisRecord& b);

void to_json(nlohmann::json& j, const MlResult& r);
void from_json(const nlohmann::json& j, MlResult& r);

void to_json(nlohmann::json& j, const EncryptedRecord& r);
void from_json(const nlohmann::json& j, EncryptedRecord& r);
