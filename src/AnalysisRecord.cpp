#include "AnalysisRecord.hpp"

bool operator==(const MlResult& a, const MlResult& b) {
    return a.isPhishing == b.isPhishing
        && a.phishingProbability == b.phishingProbability;
}

namespace {
    // A JSON null context is stored the same way as no context at all
    bool hasContext(const AnalysisRecord& r) {
        return r.analysisContext && !r.analysisContext->is_null();
    }

    bool sameContext(const AnalysisRecord& a, const AnalysisRecord& b) {
        if (!hasContext(a) || !hasContext(b)) return hasContext(a) == hasContext(b);
        return *a.analysisContext == *b.analysisContext;
    }
}

bool operator==(const AnalysisRecord& a, const AnalysisRecord& b) {
    return a.id == b.id
        && a.userEmail == b.userEmail
        && a.inputContent == b.inputContent
        && sameContext(a, b)
        && a.mlResult == b.mlResult
        && a.inputType == b.inputType
        && a.createdAt == b.createdAt
        && a.updatedAt == b.updatedAt;
}

// Field names match what the classifier API returns.
void to_json(nlohmann::json& j, const MlResult& r) {
    j = nlohmann::json{
        {"is_phishing", r.isPhishing},
        {"phishing_probability", r.phishingProbability}
    };
}

void from_json(const nlohmann::json& j, MlResult& r) {
    j.at("is_phishing").get_to(r.isPhishing);
    j.at("phishing_probability").get_to(r.phishingProbability);
}

void to_json(nlohmann::json& j, const EncryptedRecord& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"userEmail", r.userEmail},
        {"inputContent", r.inputContent},
        {"mlResult", r.mlResult},
        {"inputType", r.inputType},
        {"createdAt", r.createdAt},
        {"updatedAt", r.updatedAt}
    };
    if (r.analysisContext) {
        j["analysisContext"] = *r.analysisContext;
    } else {
        j["analysisContext"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, EncryptedRecord& r) {
    j.at("id").get_to(r.id);
    j.at("userEmail").get_to(r.userEmail);
    j.at("inputContent").get_to(r.inputContent);
    j.at("mlResult").get_to(r.mlResult);
    r.inputType = j.value("inputType", std::string{});
    r.createdAt = j.value("createdAt", std::string{});
    r.updatedAt = j.value("updatedAt", std::string{});

    auto ctx = j.find("analysisContext");
    if (ctx != j.end() && ctx->is_string()) {
        r.analysisContext = ctx->get<std::string>();
    } else {
        r.analysisContext.reset();
    }
}
