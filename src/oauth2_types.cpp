#include "oauth2_types.hpp"
#include "http_client.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace feishu_auth {

std::string OAuth2Config::ClientIdParamName() const {
    return param_style == ClientParamStyle::app_id ? "app_id" : "client_id";
}

std::string OAuth2Config::ClientSecretParamName() const {
    return param_style == ClientParamStyle::app_id ? "app_secret" : "client_secret";
}

std::vector<std::string> OAuth2Config::Validate() const {
    std::vector<std::string> problems;

    if (client_id.empty()) {
        problems.emplace_back("client_id missing from configuration");
    }
    if (client_secret.empty()) {
        problems.emplace_back("client_secret missing from configuration");
    }

    auto check_url = [&problems](const std::string& name, const std::string& url) {
        if (url.empty()) {
            problems.emplace_back(name + " missing from configuration");
            return;
        }
        try {
            HttpUrl parsed(url);
            if (parsed.Scheme().empty() || parsed.Host().empty()) {
                problems.emplace_back(name + " is not an absolute http(s) URL: " + url);
            }
        } catch (const std::invalid_argument&) {
            problems.emplace_back(name + " cannot be parsed: " + url);
        }
    };
    check_url("authorize_url", authorize_url);
    check_url("token_url", token_url);

    return problems;
}

std::optional<std::string> OAuth2Token::OtherParam(const std::string& key) const {
    return other_params.GetScalarAsString(key);
}

JsonObject OAuth2Token::ToJsonObject() const {
    JsonObject result;
    result.SetString("access_token", access_token);
    if (refresh_token) {
        result.SetString("refresh_token", *refresh_token);
    } else {
        result.SetNull("refresh_token");
    }
    if (expires_at) {
        result.SetInt("expires_at", *expires_at);
    } else {
        result.SetNull("expires_at");
    }
    result.SetString("token_type", token_type);
    result.SetObject("other_params", other_params);
    return result;
}

namespace OAuth2Utils {

std::string UrlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::uppercase << std::setw(2) << int(c) << std::nouppercase;
        }
    }
    return escaped.str();
}

std::string BuildFormBody(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string body;
    for (const auto& [key, value] : params) {
        if (!body.empty()) {
            body += "&";
        }
        body += UrlEncode(key) + "=" + UrlEncode(value);
    }
    return body;
}

std::vector<std::string> SplitScopes(const std::string& scope_string, char delimiter) {
    std::vector<std::string> scopes;
    auto add = [&scopes](const std::string& scope) {
        if (!scope.empty() && std::find(scopes.begin(), scopes.end(), scope) == scopes.end()) {
            scopes.push_back(scope);
        }
    };

    std::string current;
    for (char c : scope_string) {
        if (c == delimiter) {
            add(current);
            current.clear();
        } else {
            current += c;
        }
    }
    add(current);
    return scopes;
}

bool ValidateState(const std::string& received_state, const std::string& expected_state) {
    return !expected_state.empty() && received_state == expected_state;
}

int64_t ExpiresInToTimestamp(int64_t expires_in) {
    auto expiry = std::chrono::system_clock::now() + std::chrono::seconds(expires_in);
    return std::chrono::duration_cast<std::chrono::seconds>(expiry.time_since_epoch()).count();
}

} // namespace OAuth2Utils

} // namespace feishu_auth
