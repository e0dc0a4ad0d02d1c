#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "auth_types.hpp"
#include "feishu_auth_config.hpp"
#include "feishu_tracing.hpp"
#include "http_client.hpp"
#include "oauth2_client.hpp"
#include "result_normalizer.hpp"

namespace feishu_auth {

// Drives one authentication cycle: request, callback, cleanup. The strategy
// itself is stateless between calls; everything per attempt lives in the
// AuthAttempt owned by the caller.
class AuthStrategy {
public:
    static constexpr const char* TEST_CODE = "test_code";

    using CreateResult = std::variant<std::unique_ptr<AuthStrategy>, ConfigurationError>;

    // Validates the configuration; a missing transport or an unusable config
    // yields a ConfigurationError instead of a strategy. A null logger selects
    // the TracerEventLogger.
    static CreateResult Create(StrategyConfig config,
                               std::shared_ptr<HttpTransport> transport,
                               std::shared_ptr<EventLogger> logger = nullptr);

    // Idle -> RequestIssued. The returned attempt carries the authorization URL.
    AuthAttempt HandleRequest(const RequestParams& params) const;

    // -> CallbackReceived -> Authenticated | Failed. Per-attempt failures are
    // recorded on attempt.errors, never thrown.
    void HandleCallback(AuthAttempt& attempt, const CallbackParams& params) const;

    // Drops token and profile. Safe to call repeatedly.
    void HandleCleanup(AuthAttempt& attempt) const;

    std::optional<std::string> Uid(const AuthAttempt& attempt) const;
    std::optional<Credentials> GetCredentials(const AuthAttempt& attempt) const;
    std::optional<Info> GetInfo(const AuthAttempt& attempt) const;
    std::optional<RawInfo> GetExtra(const AuthAttempt& attempt) const;

    // Complete result of an authenticated attempt; nullopt for failed, cleaned
    // up or test-bypass attempts
    std::optional<AuthResult> BuildAuthResult(const AuthAttempt& attempt) const;

    // Session key of a miniapp token: other_params first, then the JSON
    // encoded access token. Throws DataInvalidError when neither has one.
    static std::string ResolveSessionKey(const OAuth2Token& token);

    const StrategyConfig& Config() const { return config_; }
    const ProfileFieldMapping& FieldMapping() const { return mapping_; }

private:
    AuthStrategy(StrategyConfig config, std::shared_ptr<HttpTransport> transport, std::shared_ptr<EventLogger> logger);

    JsonObject FetchProfile(const OAuth2Token& token, const CallbackParams& params) const;
    JsonObject FetchMiniappProfile(const OAuth2Token& token, const CallbackParams& params) const;

    void Fail(AuthAttempt& attempt, const AuthException& error, const std::string& event) const;
    void Log(TraceLevel level, const std::string& event, const ErrorContext& fields) const;

    StrategyConfig config_;
    ProfileFieldMapping mapping_;
    OAuth2Client client_;
    std::shared_ptr<EventLogger> logger_;
};

} // namespace feishu_auth
