#include "catch2/catch.hpp"
#include "oauth2_types.hpp"

#include <chrono>

using namespace feishu_auth;

TEST_CASE("OAuth2Config defaults and validation", "[oauth2_types]") {
    OAuth2Config config;

    SECTION("Feishu conventions by default") {
        REQUIRE(config.authorize_url == "https://open.feishu.cn/connect/qrconnect/page/sso");
        REQUIRE(config.token_url == "https://open.feishu.cn/connect/qrconnect/oauth2/access_token/");
        REQUIRE(config.ClientIdParamName() == "app_id");
        REQUIRE(config.ClientSecretParamName() == "app_secret");
        REQUIRE(config.token_body == TokenBodyEncoding::json);
    }

    SECTION("RFC parameter names") {
        config.param_style = ClientParamStyle::client_id;
        REQUIRE(config.ClientIdParamName() == "client_id");
        REQUIRE(config.ClientSecretParamName() == "client_secret");
    }

    SECTION("Missing credentials are reported") {
        auto problems = config.Validate();
        REQUIRE(problems.size() == 2);
        REQUIRE(problems[0].find("client_id") != std::string::npos);
        REQUIRE(problems[1].find("client_secret") != std::string::npos);
    }

    SECTION("Unusable endpoints are reported") {
        config.client_id = "cli_1";
        config.client_secret = "secret";
        REQUIRE(config.Validate().empty());

        config.token_url = "";
        config.authorize_url = "/relative/only";
        auto problems = config.Validate();
        REQUIRE(problems.size() == 2);
    }
}

TEST_CASE("OAuth2Token helpers", "[oauth2_types]") {
    OAuth2Token token;

    SECTION("Empty token") {
        REQUIRE_FALSE(token.HasAccessToken());
        REQUIRE_FALSE(token.OtherParam("scope"));
    }

    SECTION("JSON view carries every field") {
        token.access_token = "u-abc";
        token.token_type = "Bearer";
        token.other_params.SetString("scope", "read,write");
        auto json = token.ToJsonObject();
        REQUIRE(json.GetString("access_token") == std::optional<std::string>("u-abc"));
        REQUIRE(json.IsNull("refresh_token"));
        REQUIRE(json.IsNull("expires_at"));
        REQUIRE(json.GetObject("other_params")->GetString("scope") == std::optional<std::string>("read,write"));
        REQUIRE(token.OtherParam("scope") == std::optional<std::string>("read,write"));
    }
}

TEST_CASE("OAuth2Utils", "[oauth2_types]") {
    SECTION("URL encoding") {
        REQUIRE(OAuth2Utils::UrlEncode("abc-_.~") == "abc-_.~");
        REQUIRE(OAuth2Utils::UrlEncode("a b") == "a%20b");
        REQUIRE(OAuth2Utils::UrlEncode("https://x.cn/cb?a=1") == "https%3A%2F%2Fx.cn%2Fcb%3Fa%3D1");
    }

    SECTION("Form bodies") {
        REQUIRE(OAuth2Utils::BuildFormBody({{"code", "c 1"}, {"app_id", "cli"}}) == "code=c%201&app_id=cli");
    }

    SECTION("Scope splitting") {
        REQUIRE(OAuth2Utils::SplitScopes("read,write") == std::vector<std::string>{"read", "write"});
        REQUIRE(OAuth2Utils::SplitScopes("").empty());
        REQUIRE(OAuth2Utils::SplitScopes("read,,write,") == std::vector<std::string>{"read", "write"});
        REQUIRE(OAuth2Utils::SplitScopes("snsapi_userinfo") == std::vector<std::string>{"snsapi_userinfo"});
        REQUIRE(OAuth2Utils::SplitScopes("read,read,write,read") == std::vector<std::string>{"read", "write"});
        REQUIRE(OAuth2Utils::SplitScopes("write,read,write") == std::vector<std::string>{"write", "read"});
    }

    SECTION("State values") {
        std::string state = "st-8f2a";
        REQUIRE(OAuth2Utils::ValidateState(state, state));
        REQUIRE_FALSE(OAuth2Utils::ValidateState(state, "other"));
        REQUIRE_FALSE(OAuth2Utils::ValidateState("", ""));
    }
}
