#pragma once

#include <stdexcept>
#include <string>

namespace feishu_auth {

enum class AuthErrorKind {
    missing_code,
    provider_error,
    transport_error,
    data_invalid,
    data_corrupted,
    signature_mismatch
};

std::string AuthErrorKindToString(AuthErrorKind kind);

// Error entry recorded on an authentication attempt
struct AuthError {
    AuthErrorKind kind;
    std::string code;
    std::string description;

    std::string ToString() const;
};

// ----------------------------------------------------------------------

// Base exception for every per-attempt failure. The strategy catches these at
// the phase boundary and turns them into AuthError entries.
class AuthException : public std::runtime_error {
public:
    AuthException(AuthErrorKind kind, std::string code, std::string description);

    AuthErrorKind Kind() const { return kind_; }
    const std::string& Code() const { return code_; }
    const std::string& Description() const { return description_; }

    AuthError ToAuthError() const;

private:
    AuthErrorKind kind_;
    std::string code_;
    std::string description_;
};

class MissingCodeError : public AuthException {
public:
    explicit MissingCodeError(const std::string& description = "No code received")
        : AuthException(AuthErrorKind::missing_code, "missing_code", description) {}
};

// The identity provider rejected the request; code and description are its own
class ProviderError : public AuthException {
public:
    ProviderError(const std::string& code, const std::string& description)
        : AuthException(AuthErrorKind::provider_error, code, description) {}
};

class TransportError : public AuthException {
public:
    explicit TransportError(const std::string& description)
        : AuthException(AuthErrorKind::transport_error, "transport_error", description) {}
};

class DataInvalidError : public AuthException {
public:
    explicit DataInvalidError(const std::string& reason)
        : AuthException(AuthErrorKind::data_invalid, "data_invalid", reason) {}
};

class DataCorruptedError : public AuthException {
public:
    explicit DataCorruptedError(const std::string& reason)
        : AuthException(AuthErrorKind::data_corrupted, "data_corrupted", reason) {}
};

// Integrity check failure; callers treat it as a possible tamper signal
class SignatureMismatchError : public AuthException {
public:
    explicit SignatureMismatchError(const std::string& reason = "signature_not_matched")
        : AuthException(AuthErrorKind::signature_mismatch, "signature_mismatch", reason) {}
};

} // namespace feishu_auth
