#pragma once

#include <string>
#include <variant>
#include <vector>

#include "auth_types.hpp"
#include "feishu_tracing.hpp"
#include "oauth2_types.hpp"

namespace feishu_auth {

// Options recognized by the strategy, with their defaults
struct StrategyOptions {
    static constexpr const char* DEFAULT_SCOPE = "snsapi_userinfo";
    static constexpr const char* DEFAULT_USER_INFO_URL = "https://open.feishu.cn/connect/qrconnect/oauth2/user_info/";
    static constexpr const char* DEFAULT_PROVIDER_NAME = "feishu";

    std::string default_scope = DEFAULT_SCOPE;
    bool send_redirect_uri = true;
    // Empty selects the variant default (open_id for direct, openId for miniapp)
    std::string uid_field;
    UserInfoVariant user_info_variant = UserInfoVariant::miniapp;
    std::string user_info_url = DEFAULT_USER_INFO_URL;
    std::string provider_name = DEFAULT_PROVIDER_NAME;
};

struct StrategyConfig {
    OAuth2Config oauth2;
    StrategyOptions options;

    // Empty when the configuration is usable
    std::vector<std::string> Validate() const;
};

// Startup failure. Returned, never thrown, by the fallible constructors.
struct ConfigurationError {
    std::vector<std::string> problems;

    std::string Message() const;
};

// Reads FEISHU_CLIENT_ID, FEISHU_CLIENT_SECRET, FEISHU_REDIRECT_URI,
// FEISHU_DEFAULT_SCOPE, FEISHU_SEND_REDIRECT_URI, FEISHU_UID_FIELD,
// FEISHU_USER_INFO_VARIANT and FEISHU_USER_INFO_URL on top of the defaults.
// Unset variables keep their default. Unparseable values are reported, the
// resulting config is not validated here.
std::variant<StrategyConfig, ConfigurationError> LoadStrategyConfigFromEnvironment();

// Applies FEISHU_AUTH_TRACE_ENABLED, FEISHU_AUTH_TRACE_LEVEL,
// FEISHU_AUTH_TRACE_OUTPUT and FEISHU_AUTH_TRACE_DIRECTORY to the tracer.
// Throws std::invalid_argument on an unparseable value.
void ConfigureTracingFromEnvironment();

// NONE, ERROR, WARN, INFO, DEBUG, TRACE (case insensitive).
// Throws std::invalid_argument otherwise.
TraceLevel StringToTraceLevel(const std::string& level_str);

// true/false, 1/0, yes/no, on/off (case insensitive).
// Throws std::invalid_argument otherwise.
bool StringToBool(const std::string& value);

} // namespace feishu_auth
