#include "feishu_auth_config.hpp"
#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace feishu_auth {

namespace {

std::string Upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return value;
}

std::optional<std::string> ReadEnv(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

std::vector<std::string> StrategyConfig::Validate() const {
    auto problems = oauth2.Validate();

    if (options.default_scope.empty()) {
        problems.emplace_back("default_scope must not be empty");
    }
    if (options.provider_name.empty()) {
        problems.emplace_back("provider_name must not be empty");
    }

    if (options.user_info_variant == UserInfoVariant::direct) {
        try {
            HttpUrl parsed(options.user_info_url);
            if (parsed.Scheme().empty() || parsed.Host().empty()) {
                problems.emplace_back("user_info_url is not an absolute http(s) URL: " + options.user_info_url);
            }
        } catch (const std::invalid_argument&) {
            problems.emplace_back("user_info_url cannot be parsed: " + options.user_info_url);
        }
    }

    return problems;
}

std::string ConfigurationError::Message() const {
    std::string message = "Invalid Feishu authentication configuration";
    for (size_t i = 0; i < problems.size(); i++) {
        message += (i == 0 ? ": " : "; ") + problems[i];
    }
    return message;
}

TraceLevel StringToTraceLevel(const std::string& level_str) {
    auto level_str_upper = Upper(level_str);

    if (level_str_upper == "NONE") {
        return TraceLevel::NONE;
    } else if (level_str_upper == "ERROR") {
        return TraceLevel::ERROR;
    } else if (level_str_upper == "WARN") {
        return TraceLevel::WARN;
    } else if (level_str_upper == "INFO") {
        return TraceLevel::INFO;
    } else if (level_str_upper == "DEBUG") {
        return TraceLevel::DEBUG_LEVEL;
    } else if (level_str_upper == "TRACE") {
        return TraceLevel::TRACE;
    }

    throw std::invalid_argument("Invalid trace level: " + level_str + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

bool StringToBool(const std::string& value) {
    auto upper = Upper(value);
    if (upper == "TRUE" || upper == "1" || upper == "YES" || upper == "ON") {
        return true;
    }
    if (upper == "FALSE" || upper == "0" || upper == "NO" || upper == "OFF") {
        return false;
    }
    throw std::invalid_argument("Invalid boolean value: " + value);
}

std::variant<StrategyConfig, ConfigurationError> LoadStrategyConfigFromEnvironment() {
    StrategyConfig config;
    ConfigurationError error;

    if (auto value = ReadEnv("FEISHU_CLIENT_ID")) {
        config.oauth2.client_id = *value;
    }
    if (auto value = ReadEnv("FEISHU_CLIENT_SECRET")) {
        config.oauth2.client_secret = *value;
    }
    if (auto value = ReadEnv("FEISHU_REDIRECT_URI")) {
        config.oauth2.redirect_uri = *value;
    }
    if (auto value = ReadEnv("FEISHU_DEFAULT_SCOPE")) {
        config.options.default_scope = *value;
    }
    if (auto value = ReadEnv("FEISHU_SEND_REDIRECT_URI")) {
        try {
            config.options.send_redirect_uri = StringToBool(*value);
        } catch (const std::invalid_argument& e) {
            error.problems.emplace_back("FEISHU_SEND_REDIRECT_URI: " + std::string(e.what()));
        }
    }
    if (auto value = ReadEnv("FEISHU_UID_FIELD")) {
        config.options.uid_field = *value;
    }
    if (auto value = ReadEnv("FEISHU_USER_INFO_VARIANT")) {
        try {
            config.options.user_info_variant = StringToUserInfoVariant(*value);
        } catch (const std::invalid_argument& e) {
            error.problems.emplace_back("FEISHU_USER_INFO_VARIANT: " + std::string(e.what()));
        }
    }
    if (auto value = ReadEnv("FEISHU_USER_INFO_URL")) {
        config.options.user_info_url = *value;
    }

    if (!error.problems.empty()) {
        return error;
    }
    return config;
}

void ConfigureTracingFromEnvironment() {
    auto& tracer = FeishuTracer::Instance();

    if (auto value = ReadEnv("FEISHU_AUTH_TRACE_LEVEL")) {
        tracer.SetLevel(StringToTraceLevel(*value));
    }
    if (auto value = ReadEnv("FEISHU_AUTH_TRACE_OUTPUT")) {
        auto output_upper = Upper(*value);
        if (output_upper != "CONSOLE" && output_upper != "FILE" && output_upper != "BOTH") {
            throw std::invalid_argument("Invalid trace output: " + *value + ". Valid outputs are: console, file, both");
        }
        std::string output_lower = *value;
        std::transform(output_lower.begin(), output_lower.end(), output_lower.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        tracer.SetOutputMode(output_lower);
    }
    if (auto value = ReadEnv("FEISHU_AUTH_TRACE_DIRECTORY")) {
        tracer.SetTraceDirectory(*value);
    }
    if (auto value = ReadEnv("FEISHU_AUTH_TRACE_ENABLED")) {
        tracer.SetEnabled(StringToBool(*value));
    }
}

} // namespace feishu_auth
