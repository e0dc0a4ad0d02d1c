#include "auth_types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace feishu_auth {

std::string AttemptStateToString(AttemptState state) {
    switch (state) {
        case AttemptState::Idle: return "Idle";
        case AttemptState::RequestIssued: return "RequestIssued";
        case AttemptState::CallbackReceived: return "CallbackReceived";
        case AttemptState::Authenticated: return "Authenticated";
        case AttemptState::Failed: return "Failed";
        case AttemptState::CleanedUp: return "CleanedUp";
        default: return "Unknown";
    }
}

std::string UserInfoVariantToString(UserInfoVariant variant) {
    return variant == UserInfoVariant::direct ? "direct" : "miniapp";
}

UserInfoVariant StringToUserInfoVariant(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "direct") {
        return UserInfoVariant::direct;
    }
    if (lower == "miniapp") {
        return UserInfoVariant::miniapp;
    }
    throw std::invalid_argument("Unknown user info variant: " + name);
}

JsonObject RawInfo::ToJsonObject() const {
    JsonObject result;
    result.SetObject("token", token);
    result.SetObject("user", user);
    return result;
}

} // namespace feishu_auth
