#pragma once

#include <optional>
#include <string>

#include "auth_types.hpp"
#include "json_object.hpp"
#include "oauth2_types.hpp"

namespace feishu_auth {

// Provider field names read for each normalized profile field. An empty
// optional means the variant never carries that field.
struct ProfileFieldMapping {
    std::optional<std::string> nickname;
    std::optional<std::string> name;
    std::optional<std::string> image;
    std::optional<std::string> email;
    std::string default_uid_field;

    static ProfileFieldMapping ForVariant(UserInfoVariant variant);
};

namespace ResultNormalizer {
    // token_type falls back to provider_name when the provider sent none
    Credentials ToCredentials(const OAuth2Token& token, const std::string& provider_name);

    Info ToInfo(const JsonObject& profile, const ProfileFieldMapping& mapping);

    RawInfo ToRawInfo(const OAuth2Token& token, const JsonObject& profile);

    // Profile value under uid_field, or under the mapping's default when uid_field is empty
    std::optional<std::string> Uid(const JsonObject& profile, const std::string& uid_field,
                                   const ProfileFieldMapping& mapping);
}

} // namespace feishu_auth
