#include "catch2/catch.hpp"
#include "result_normalizer.hpp"

using namespace feishu_auth;

namespace {

OAuth2Token TokenWithScope(const std::string& scope) {
    OAuth2Token token;
    token.access_token = "u-tok";
    token.other_params.SetString("scope", scope);
    return token;
}

} // anonymous namespace

TEST_CASE("Credentials from token", "[normalizer]") {
    SECTION("Comma joined scopes") {
        auto credentials = ResultNormalizer::ToCredentials(TokenWithScope("read,write"), "feishu");
        REQUIRE(credentials.scopes == std::vector<std::string>{"read", "write"});
    }

    SECTION("Repeated scopes collapse in first-seen order") {
        auto credentials = ResultNormalizer::ToCredentials(TokenWithScope("write,read,write,read"), "feishu");
        REQUIRE(credentials.scopes == std::vector<std::string>{"write", "read"});
    }

    SECTION("Empty scope string yields no scopes") {
        auto credentials = ResultNormalizer::ToCredentials(TokenWithScope(""), "feishu");
        REQUIRE(credentials.scopes.empty());
    }

    SECTION("Missing scope yields no scopes") {
        OAuth2Token token;
        token.access_token = "u-tok";
        REQUIRE(ResultNormalizer::ToCredentials(token, "feishu").scopes.empty());
    }

    SECTION("Token type falls back to provider name and expiry flag follows expires_at") {
        auto token = TokenWithScope("read");
        auto credentials = ResultNormalizer::ToCredentials(token, "feishu");
        REQUIRE(credentials.token == "u-tok");
        REQUIRE(credentials.token_type == "feishu");
        REQUIRE_FALSE(credentials.expires);
        REQUIRE_FALSE(credentials.refresh_token.has_value());

        token.token_type = "Bearer";
        token.expires_at = 1700000000;
        token.refresh_token = "ur-tok";
        credentials = ResultNormalizer::ToCredentials(token, "feishu");
        REQUIRE(credentials.token_type == "Bearer");
        REQUIRE(credentials.expires);
        REQUIRE(credentials.expires_at == std::optional<int64_t>(1700000000));
        REQUIRE(credentials.refresh_token == std::optional<std::string>("ur-tok"));
        REQUIRE(credentials.other.GetString("scope") == std::optional<std::string>("read"));
    }
}

TEST_CASE("Profile field mapping per variant", "[normalizer]") {
    SECTION("Direct profile") {
        auto mapping = ProfileFieldMapping::ForVariant(UserInfoVariant::direct);
        auto profile = JsonObject::Parse(R"({"name":"Ada","avatar_url":"https://a/ada.png","email":"ada@example.com","open_id":"ou_1"})");
        auto info = ResultNormalizer::ToInfo(profile, mapping);
        REQUIRE(info.name == std::optional<std::string>("Ada"));
        REQUIRE(info.nickname == std::optional<std::string>("Ada"));
        REQUIRE(info.image == std::optional<std::string>("https://a/ada.png"));
        REQUIRE(info.email == std::optional<std::string>("ada@example.com"));
        REQUIRE(ResultNormalizer::Uid(profile, "", mapping) == std::optional<std::string>("ou_1"));
    }

    SECTION("Miniapp profile") {
        auto mapping = ProfileFieldMapping::ForVariant(UserInfoVariant::miniapp);
        auto profile = JsonObject::Parse(R"({"nickName":"Ada","avatarUrl":"https://a/ada.png","openId":"o_1","name":"ignored"})");
        auto info = ResultNormalizer::ToInfo(profile, mapping);
        REQUIRE(info.nickname == std::optional<std::string>("Ada"));
        REQUIRE(info.image == std::optional<std::string>("https://a/ada.png"));
        REQUIRE_FALSE(info.name.has_value());
        REQUIRE_FALSE(info.email.has_value());
        REQUIRE(ResultNormalizer::Uid(profile, "", mapping) == std::optional<std::string>("o_1"));
    }

    SECTION("Absent fields stay absent rather than empty") {
        auto mapping = ProfileFieldMapping::ForVariant(UserInfoVariant::direct);
        auto info = ResultNormalizer::ToInfo(JsonObject::Parse(R"({"name":"Ada"})"), mapping);
        REQUIRE_FALSE(info.email.has_value());
        REQUIRE_FALSE(info.image.has_value());
    }

    SECTION("Configured uid field wins") {
        auto mapping = ProfileFieldMapping::ForVariant(UserInfoVariant::miniapp);
        auto profile = JsonObject::Parse(R"({"openId":"o_1","unionid":"U123"})");
        REQUIRE(ResultNormalizer::Uid(profile, "unionid", mapping) == std::optional<std::string>("U123"));
        REQUIRE_FALSE(ResultNormalizer::Uid(profile, "missing", mapping).has_value());
    }
}

TEST_CASE("Raw info passthrough", "[normalizer]") {
    auto token = TokenWithScope("read");
    auto profile = JsonObject::Parse(R"({"nickName":"Ada"})");
    auto raw = ResultNormalizer::ToRawInfo(token, profile);

    profile.SetString("nickName", "changed");
    REQUIRE(raw.user.GetString("nickName") == std::optional<std::string>("Ada"));
    REQUIRE(raw.token.GetString("access_token") == std::optional<std::string>("u-tok"));

    auto json = raw.ToJsonObject();
    REQUIRE(json.GetObject("token").has_value());
    REQUIRE(json.GetObject("user")->GetString("nickName") == std::optional<std::string>("Ada"));
}
