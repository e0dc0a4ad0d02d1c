#include "signature_verifier.hpp"
#include "auth_errors.hpp"
#include "crypto_utils.hpp"
#include "feishu_tracing.hpp"

namespace feishu_auth {

std::string SignatureVerifier::ComputeSignature(const std::string& raw_data, const std::string& session_key) {
    return CryptoUtils::Sha1HexLower(raw_data + session_key);
}

bool SignatureVerifier::Verify(const std::string& raw_data, const std::string& session_key, const std::string& signature) {
    // Plain equality; comparison time is not independent of the mismatch position
    return ComputeSignature(raw_data, session_key) == signature;
}

void SignatureVerifier::VerifyOrThrow(const std::string& raw_data, const std::string& session_key, const std::string& signature) {
    if (!Verify(raw_data, session_key, signature)) {
        FEISHU_TRACE_WARN("SIGNATURE", "Signature mismatch for raw_data of " + std::to_string(raw_data.size()) + " bytes");
        throw SignatureMismatchError("signature_not_matched");
    }
    FEISHU_TRACE_DEBUG("SIGNATURE", "Signature verified");
}

} // namespace feishu_auth
