#include "oauth2_client.hpp"
#include "auth_errors.hpp"
#include "error_context.hpp"
#include "feishu_tracing.hpp"

#include <stdexcept>

namespace feishu_auth {

namespace {

// Feishu open-platform envelopes report failures as {"code": <non-zero>, "msg": ...}
std::optional<ProviderError> EnvelopeError(const JsonObject& body) {
    if (body.Has("error")) {
        return ProviderError(body.GetScalarAsString("error").value_or(""),
                             body.GetScalarAsString("error_description").value_or(""));
    }
    auto code = body.GetInt("code");
    if (code && *code != 0) {
        return ProviderError(std::to_string(*code), body.GetScalarAsString("msg").value_or(""));
    }
    return std::nullopt;
}

} // anonymous namespace

OAuth2Client::OAuth2Client(OAuth2Config config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    if (!transport_) {
        throw std::invalid_argument("OAuth2Client requires an HTTP transport");
    }
}

std::string OAuth2Client::BuildAuthorizationUrl(const std::string& scope,
                                                const std::optional<std::string>& redirect_uri,
                                                const std::optional<std::string>& state) const {
    HttpUrl url(config_.authorize_url);
    url.AppendQueryParameter(config_.ClientIdParamName(), OAuth2Utils::UrlEncode(config_.client_id));
    url.AppendQueryParameter("response_type", "code");
    if (redirect_uri && !redirect_uri->empty()) {
        url.AppendQueryParameter("redirect_uri", OAuth2Utils::UrlEncode(*redirect_uri));
    }
    url.AppendQueryParameter("scope", OAuth2Utils::UrlEncode(scope));
    if (state && !state->empty()) {
        url.AppendQueryParameter("state", OAuth2Utils::UrlEncode(*state));
    }

    auto result = url.ToString();
    FEISHU_TRACE_DEBUG("OAUTH2_CLIENT", "Built authorization URL: " + result);
    return result;
}

HttpRequest OAuth2Client::BuildTokenRequest(const std::string& code) const {
    std::string content_type;
    std::string body;

    if (config_.token_body == TokenBodyEncoding::json) {
        JsonObject params;
        params.SetString(config_.ClientIdParamName(), config_.client_id);
        params.SetString(config_.ClientSecretParamName(), config_.client_secret);
        params.SetString("code", code);
        params.SetString("grant_type", "authorization_code");
        if (!config_.redirect_uri.empty()) {
            params.SetString("redirect_uri", config_.redirect_uri);
        }
        content_type = "application/json";
        body = params.ToJson();
    } else {
        std::vector<std::pair<std::string, std::string>> params = {
            {config_.ClientIdParamName(), config_.client_id},
            {config_.ClientSecretParamName(), config_.client_secret},
            {"code", code},
            {"grant_type", "authorization_code"}
        };
        if (!config_.redirect_uri.empty()) {
            params.emplace_back("redirect_uri", config_.redirect_uri);
        }
        content_type = "application/x-www-form-urlencoded";
        body = OAuth2Utils::BuildFormBody(params);
    }

    HttpRequest request(HttpMethod::POST, config_.token_url, content_type, body);
    request.headers["Accept"] = "application/json";
    request.headers["Content-Type"] = content_type;
    return request;
}

std::unique_ptr<HttpResponse> OAuth2Client::Send(HttpRequest& request, const std::string& operation) const {
    std::unique_ptr<HttpResponse> response;
    try {
        response = transport_->SendRequest(request);
    } catch (const HttpException& e) {
        FEISHU_TRACE_ERROR("OAUTH2_CLIENT", operation + " failed: " + std::string(e.what()));
        throw TransportError(operation + " failed: " + std::string(e.what()));
    } catch (const std::exception& e) {
        FEISHU_TRACE_ERROR("OAUTH2_CLIENT", operation + " failed in transport: " + std::string(e.what()));
        throw TransportError(operation + " failed: " + std::string(e.what()));
    }

    if (!response) {
        FEISHU_TRACE_ERROR("OAUTH2_CLIENT", operation + ": no response received");
        throw TransportError(operation + ": no response received");
    }
    return response;
}

OAuth2Token OAuth2Client::ExchangeCode(const std::string& code) const {
    if (code.empty()) {
        throw MissingCodeError("Missing required key `code` for token exchange");
    }

    FEISHU_TRACE_INFO("OAUTH2_CLIENT", "Exchanging authorization code for token");

    auto request = BuildTokenRequest(code);
    auto response = Send(request, "Token exchange");

    FEISHU_TRACE_DEBUG("OAUTH2_CLIENT", "Token exchange response status: " + std::to_string(response->Code()));

    if (!response->IsSuccess()) {
        auto body = JsonObject::TryParse(response->Content());
        if (body && EnvelopeError(*body)) {
            FEISHU_TRACE_WARN("OAUTH2_CLIENT", "Token endpoint rejected the exchange with HTTP " + std::to_string(response->Code()));
            return ParseTokenResponse(response->Content());
        }
        throw TransportError("Token endpoint returned HTTP " + std::to_string(response->Code()));
    }

    return ParseTokenResponse(response->Content());
}

OAuth2Token OAuth2Client::ParseTokenResponse(const std::string& response_content) {
    auto parsed = JsonObject::TryParse(response_content);
    if (!parsed) {
        FEISHU_TRACE_ERROR("OAUTH2_CLIENT", "Token response is not a JSON object");
        throw DataInvalidError("token response is not a JSON object");
    }

    // Open-platform envelope: {"code": 0, "data": {"access_token": ...}}
    JsonObject root = *parsed;
    if (!root.Has("access_token")) {
        auto data = root.GetObject("data");
        if (data && data->Has("access_token")) {
            root = *data;
        }
    }

    OAuth2Token token;
    auto access_token = root.GetString("access_token");

    if (access_token && !access_token->empty()) {
        token.access_token = *access_token;
        token.refresh_token = root.GetString("refresh_token");
        token.token_type = root.GetString("token_type").value_or("");
        auto expires_in = root.GetInt("expires_in");
        if (expires_in) {
            token.expires_at = OAuth2Utils::ExpiresInToTimestamp(*expires_in);
        }

        for (const auto& key : root.Keys()) {
            if (key != "access_token" && key != "refresh_token" && key != "token_type" && key != "expires_in") {
                token.other_params.SetValueFrom(key, root, key);
            }
        }
        FEISHU_TRACE_DEBUG("OAUTH2_CLIENT", "Parsed access token " + RedactSecret(token.access_token));
        return token;
    }

    token.other_params = root;

    auto error = EnvelopeError(root);
    if (error) {
        token.other_params.SetString("error", error->Code());
        token.other_params.SetString("error_description", error->Description());
        FEISHU_TRACE_WARN("OAUTH2_CLIENT", "Token response carries error: " + error->Code());
        return token;
    }

    if (root.Has("session_key")) {
        // Session response: the encoded session structure stands in for the access token
        token.access_token = response_content;
        FEISHU_TRACE_DEBUG("OAUTH2_CLIENT", "Parsed session token response");
        return token;
    }

    FEISHU_TRACE_WARN("OAUTH2_CLIENT", "Token response has neither access_token nor error");
    return token;
}

JsonObject OAuth2Client::FetchUserInfo(const OAuth2Token& token, const std::string& endpoint) const {
    if (!token.HasAccessToken()) {
        throw DataInvalidError("cannot fetch user info without an access token");
    }

    FEISHU_TRACE_INFO("OAUTH2_CLIENT", "Fetching user info");

    HttpRequest request(HttpMethod::GET, endpoint);
    request.BearerAuth(token.access_token);
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";

    auto response = Send(request, "User info request");
    auto body = JsonObject::TryParse(response->Content());

    if (!response->IsSuccess()) {
        if (body) {
            auto error = EnvelopeError(*body);
            if (error) {
                throw *error;
            }
        }
        throw TransportError("User info endpoint returned HTTP " + std::to_string(response->Code()));
    }

    if (!body) {
        FEISHU_TRACE_ERROR("OAUTH2_CLIENT", "User info response is not a JSON object");
        throw DataInvalidError("user info response is not a JSON object");
    }

    auto error = EnvelopeError(*body);
    if (error) {
        throw *error;
    }

    auto data = body->GetObject("data");
    if (!data) {
        ErrorContext ctx;
        ctx.Set("keys", std::to_string(body->Size()));
        FEISHU_TRACE_ERROR("OAUTH2_CLIENT", ctx.Format("User info response has no data object"));
        throw DataInvalidError("user info response has no data object");
    }

    data->MergeMissing(token.other_params);
    return std::move(*data);
}

} // namespace feishu_auth
