#pragma once

#include <optional>
#include <string>
#include <vector>

#include "auth_errors.hpp"
#include "json_object.hpp"
#include "oauth2_types.hpp"

namespace feishu_auth {

enum class AttemptState {
    Idle,
    RequestIssued,
    CallbackReceived,
    Authenticated,
    Failed,
    CleanedUp
};

std::string AttemptStateToString(AttemptState state);

// How the callback obtains the user profile
enum class UserInfoVariant {
    direct,    // bearer GET of the user-info endpoint
    miniapp    // signed, AES encrypted payload delivered with the callback
};

std::string UserInfoVariantToString(UserInfoVariant variant);
// Throws std::invalid_argument for unknown names
UserInfoVariant StringToUserInfoVariant(const std::string& name);

// Per-cycle state of one request/callback round trip. Owned by a single caller.
struct AuthAttempt {
    std::vector<std::string> scopes;
    std::optional<std::string> state;
    std::string redirect_url;

    std::optional<OAuth2Token> token;
    std::optional<JsonObject> profile;

    std::vector<AuthError> errors;
    AttemptState current_state = AttemptState::Idle;

    // Set when the callback used the sentinel test code; no token or profile is stored
    bool test_bypass = false;

    bool IsAuthenticated() const { return current_state == AttemptState::Authenticated; }
    bool IsFailed() const { return current_state == AttemptState::Failed; }
    bool HasErrors() const { return !errors.empty(); }
};

// Host-decoded parameters of the request phase
struct RequestParams {
    std::optional<std::string> scope;
    std::optional<std::string> state;
};

// Host-decoded parameters of the callback phase
struct CallbackParams {
    std::optional<std::string> code;
    std::optional<std::string> state;

    // Miniapp variant only, required together
    std::optional<std::string> signature;
    std::optional<std::string> raw_data;
    std::optional<std::string> iv;
    std::optional<std::string> encrypted_data;
};

// ----------------------------------------------------------------------

struct Credentials {
    std::string token;
    std::optional<std::string> refresh_token;
    std::optional<int64_t> expires_at;
    std::string token_type;
    bool expires = false;
    std::vector<std::string> scopes;
    JsonObject other;
};

// Normalized profile. Fields the provider did not send stay empty.
struct Info {
    std::optional<std::string> nickname;
    std::optional<std::string> name;
    std::optional<std::string> image;
    std::optional<std::string> email;
};

struct RawInfo {
    JsonObject token;
    JsonObject user;

    JsonObject ToJsonObject() const;
};

struct AuthResult {
    std::string provider;
    std::optional<std::string> uid;
    Credentials credentials;
    Info info;
    RawInfo extra;
};

} // namespace feishu_auth
