#include "auth_errors.hpp"

namespace feishu_auth {

std::string AuthErrorKindToString(AuthErrorKind kind) {
    switch (kind) {
        case AuthErrorKind::missing_code: return "MissingCode";
        case AuthErrorKind::provider_error: return "ProviderError";
        case AuthErrorKind::transport_error: return "TransportError";
        case AuthErrorKind::data_invalid: return "DataInvalid";
        case AuthErrorKind::data_corrupted: return "DataCorrupted";
        case AuthErrorKind::signature_mismatch: return "SignatureMismatch";
        default: return "Unknown";
    }
}

std::string AuthError::ToString() const {
    return AuthErrorKindToString(kind) + "(" + code + "): " + description;
}

AuthException::AuthException(AuthErrorKind kind, std::string code, std::string description)
    : std::runtime_error(AuthErrorKindToString(kind) + ": " + code + " - " + description),
      kind_(kind),
      code_(std::move(code)),
      description_(std::move(description)) {
}

AuthError AuthException::ToAuthError() const {
    return AuthError{kind_, code_, description_};
}

} // namespace feishu_auth
