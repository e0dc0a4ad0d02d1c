#pragma once

#include <memory>
#include <optional>
#include <string>

#include "http_client.hpp"
#include "json_object.hpp"
#include "oauth2_types.hpp"

namespace feishu_auth {

class OAuth2Client {
public:
    OAuth2Client(OAuth2Config config, std::shared_ptr<HttpTransport> transport);

    // Pure URL construction, no network call
    std::string BuildAuthorizationUrl(const std::string& scope,
                                      const std::optional<std::string>& redirect_uri = std::nullopt,
                                      const std::optional<std::string>& state = std::nullopt) const;

    // Exchanges an authorization code for a token. A token without access
    // token (provider reported error) is returned, not thrown, so the caller
    // can read error/error_description from other_params.
    // Throws MissingCodeError, TransportError, DataInvalidError.
    OAuth2Token ExchangeCode(const std::string& code) const;

    // Bearer GET of the user-info endpoint. Returns the "data" object with the
    // token extras merged in as fallbacks.
    // Throws TransportError, ProviderError, DataInvalidError.
    JsonObject FetchUserInfo(const OAuth2Token& token, const std::string& endpoint) const;

    const OAuth2Config& Config() const { return config_; }

    static OAuth2Token ParseTokenResponse(const std::string& response_content);

private:
    HttpRequest BuildTokenRequest(const std::string& code) const;
    std::unique_ptr<HttpResponse> Send(HttpRequest& request, const std::string& operation) const;

    OAuth2Config config_;
    std::shared_ptr<HttpTransport> transport_;
};

} // namespace feishu_auth
