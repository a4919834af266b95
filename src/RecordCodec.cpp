#include "RecordCodec.hpp"
#include "EncryptionErrors.hpp"
#include "EncryptionManager.hpp"

#include <stdexcept>

EncryptedRecord encryptRecord(const AnalysisRecord& record, const EncryptionManager& enc) {
    if (record.userEmail.empty() || record.inputContent.empty() || !record.mlResult) {
        throw MissingFields();
    }
    const double p = record.mlResult->phishingProbability;
    if (!(p >= 0.0 && p <= 1.0)) {
        throw std::invalid_argument("encryptRecord: phishingProbability must be within [0, 1]");
    }

    EncryptedRecord out;
    out.id        = record.id;
    out.inputType = record.inputType;
    out.createdAt = record.createdAt;
    out.updatedAt = record.updatedAt;

    out.userEmail    = enc.seal(record.userEmail);
    out.inputContent = enc.seal(record.inputContent);
    // An absent context is sealed as "" so every record has the same shape
    out.analysisContext = enc.seal(record.analysisContext && !record.analysisContext->is_null()
                                       ? record.analysisContext->dump()
                                       : std::string{});
    out.mlResult = enc.seal(nlohmann::json(*record.mlResult).dump());
    return out;
}

AnalysisRecord decryptRecord(const EncryptedRecord& record, const EncryptionManager& enc) {
    AnalysisRecord out;
    out.id        = record.id;
    out.inputType = record.inputType;
    out.createdAt = record.createdAt;
    out.updatedAt = record.updatedAt;

    out.userEmail    = enc.open(record.userEmail);
    out.inputContent = enc.open(record.inputContent);

    if (record.analysisContext && !record.analysisContext->empty()) {
        const std::string text = enc.open(*record.analysisContext);
        if (!text.empty()) {
            auto ctx = nlohmann::json::parse(text, nullptr, false);
            if (ctx.is_discarded()) {
                throw std::invalid_argument("decryptRecord: analysisContext is not JSON");
            }
            out.analysisContext = std::move(ctx);
        }
    }

    auto ml = nlohmann::json::parse(enc.open(record.mlResult), nullptr, false);
    if (ml.is_discarded() || !ml.is_object()
        || !ml.contains("is_phishing") || !ml["is_phishing"].is_boolean()
        || !ml.contains("phishing_probability") || !ml["phishing_probability"].is_number()) {
        throw std::invalid_argument("decryptRecord: mlResult payload is malformed");
    }
    out.mlResult = ml.get<MlResult>();
    return out;
}
