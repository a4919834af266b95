#pragma once
#include "AnalysisRecord.hpp"

class EncryptionManager;

// Seals userEmail, inputContent, analysisContext and mlResult, one fresh
// nonce each. Throws MissingFields when userEmail, inputContent or mlResult
// is empty, std::invalid_argument when the probability is outside [0, 1].
EncryptedRecord encryptRecord(const AnalysisRecord& record, const EncryptionManager& enc);

// Throws AuthenticationError when any sealed field fails to verify under
// `enc`, std::invalid_argument when a field is not a sealed pair or the
// decrypted payload is malformed.
AnalysisRecord decryptRecord(const EncryptedRecord& record, const EncryptionManager& enc);
