#include "result_normalizer.hpp"

namespace feishu_auth {

namespace {

std::optional<std::string> Lookup(const JsonObject& profile, const std::optional<std::string>& field) {
    if (!field) {
        return std::nullopt;
    }
    return profile.GetScalarAsString(*field);
}

} // anonymous namespace

ProfileFieldMapping ProfileFieldMapping::ForVariant(UserInfoVariant variant) {
    ProfileFieldMapping mapping;
    if (variant == UserInfoVariant::direct) {
        mapping.nickname = "name";
        mapping.name = "name";
        mapping.image = "avatar_url";
        mapping.email = "email";
        mapping.default_uid_field = "open_id";
    } else {
        mapping.nickname = "nickName";
        mapping.image = "avatarUrl";
        mapping.default_uid_field = "openId";
    }
    return mapping;
}

namespace ResultNormalizer {

Credentials ToCredentials(const OAuth2Token& token, const std::string& provider_name) {
    Credentials credentials;
    credentials.token = token.access_token;
    credentials.refresh_token = token.refresh_token;
    credentials.expires_at = token.expires_at;
    credentials.token_type = token.token_type.empty() ? provider_name : token.token_type;
    credentials.expires = token.expires_at.has_value();
    credentials.scopes = OAuth2Utils::SplitScopes(token.OtherParam("scope").value_or(""), ',');
    credentials.other = token.other_params;
    return credentials;
}

Info ToInfo(const JsonObject& profile, const ProfileFieldMapping& mapping) {
    Info info;
    info.nickname = Lookup(profile, mapping.nickname);
    info.name = Lookup(profile, mapping.name);
    info.image = Lookup(profile, mapping.image);
    info.email = Lookup(profile, mapping.email);
    return info;
}

RawInfo ToRawInfo(const OAuth2Token& token, const JsonObject& profile) {
    RawInfo raw;
    raw.token = token.ToJsonObject();
    raw.user = profile;
    return raw;
}

std::optional<std::string> Uid(const JsonObject& profile, const std::string& uid_field,
                               const ProfileFieldMapping& mapping) {
    const auto& field = uid_field.empty() ? mapping.default_uid_field : uid_field;
    return profile.GetScalarAsString(field);
}

} // namespace ResultNormalizer

} // namespace feishu_auth
