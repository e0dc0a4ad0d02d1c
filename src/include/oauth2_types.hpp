#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "json_object.hpp"

namespace feishu_auth {

// Parameter names the provider expects for the client credentials
enum class ClientParamStyle {
    app_id,      // app_id / app_secret (Feishu)
    client_id    // client_id / client_secret (RFC 6749)
};

// Encoding of the token exchange request body
enum class TokenBodyEncoding {
    json,
    form
};

// OAuth2 provider configuration
struct OAuth2Config {
    static constexpr const char* DEFAULT_AUTHORIZE_URL = "https://open.feishu.cn/connect/qrconnect/page/sso";
    static constexpr const char* DEFAULT_TOKEN_URL = "https://open.feishu.cn/connect/qrconnect/oauth2/access_token/";

    std::string client_id;
    std::string client_secret;
    std::string authorize_url;
    std::string token_url;
    std::string redirect_uri;
    ClientParamStyle param_style;
    TokenBodyEncoding token_body;

    OAuth2Config() :
        client_id(""),
        client_secret(""),
        authorize_url(DEFAULT_AUTHORIZE_URL),
        token_url(DEFAULT_TOKEN_URL),
        redirect_uri(""),
        param_style(ClientParamStyle::app_id),
        token_body(TokenBodyEncoding::json) {}

    std::string ClientIdParamName() const;
    std::string ClientSecretParamName() const;

    // Empty when the configuration is usable
    std::vector<std::string> Validate() const;
};

// Token produced by a code exchange. Immutable once returned by the client.
struct OAuth2Token {
    std::string access_token;
    std::optional<std::string> refresh_token;
    std::optional<int64_t> expires_at;   // Unix timestamp
    std::string token_type;
    JsonObject other_params;

    bool HasAccessToken() const { return !access_token.empty(); }

    // other_params[key] as text, when present
    std::optional<std::string> OtherParam(const std::string& key) const;

    // Lossless JSON view used for raw info pass-through
    JsonObject ToJsonObject() const;
};

// Utility functions for OAuth2 operations
namespace OAuth2Utils {
    std::string UrlEncode(const std::string& value);

    std::string BuildFormBody(const std::vector<std::pair<std::string, std::string>>& params);

    // Splits a comma joined scope string. Empty segments and repeats are dropped,
    // first occurrence order is kept.
    std::vector<std::string> SplitScopes(const std::string& scope_string, char delimiter = ',');

    // False when no state was issued
    bool ValidateState(const std::string& received_state, const std::string& expected_state);

    int64_t ExpiresInToTimestamp(int64_t expires_in);
}

} // namespace feishu_auth
