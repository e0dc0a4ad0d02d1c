#pragma once

#include <string>

namespace feishu_auth {

// Provider-mandated integrity check for the miniapp payload: the signature is
// lowercase hex SHA-1 over raw_data immediately followed by the session key.
// This is a plain digest over the concatenation, not an HMAC.
class SignatureVerifier {
public:
    static std::string ComputeSignature(const std::string& raw_data, const std::string& session_key);

    static bool Verify(const std::string& raw_data, const std::string& session_key, const std::string& signature);

    // Throws SignatureMismatchError when Verify fails
    static void VerifyOrThrow(const std::string& raw_data, const std::string& session_key, const std::string& signature);
};

} // namespace feishu_auth
