#include "auth_strategy.hpp"
#include "auth_errors.hpp"
#include "error_context.hpp"
#include "payload_decryptor.hpp"
#include "signature_verifier.hpp"

namespace feishu_auth {

AuthStrategy::CreateResult AuthStrategy::Create(StrategyConfig config,
                                                std::shared_ptr<HttpTransport> transport,
                                                std::shared_ptr<EventLogger> logger) {
    ConfigurationError error;
    error.problems = config.Validate();
    if (!transport) {
        error.problems.emplace_back("HTTP transport is required");
    }

    if (!error.problems.empty()) {
        FEISHU_TRACE_ERROR("AUTH_STRATEGY", error.Message());
        return error;
    }

    if (!logger) {
        logger = std::make_shared<TracerEventLogger>();
    }

    FEISHU_TRACE_INFO("AUTH_STRATEGY", "Created strategy for provider '" + config.options.provider_name +
                                       "' with " + UserInfoVariantToString(config.options.user_info_variant) + " user info");
    return std::unique_ptr<AuthStrategy>(new AuthStrategy(std::move(config), std::move(transport), std::move(logger)));
}

AuthStrategy::AuthStrategy(StrategyConfig config, std::shared_ptr<HttpTransport> transport, std::shared_ptr<EventLogger> logger)
    : config_(std::move(config)),
      mapping_(ProfileFieldMapping::ForVariant(config_.options.user_info_variant)),
      client_(config_.oauth2, std::move(transport)),
      logger_(std::move(logger)) {
}

void AuthStrategy::Log(TraceLevel level, const std::string& event, const ErrorContext& fields) const {
    logger_->Log(level, event, fields);
}

AuthAttempt AuthStrategy::HandleRequest(const RequestParams& params) const {
    AuthAttempt attempt;

    // An explicit empty scope is sent as given
    std::string scope = params.scope.value_or(config_.options.default_scope);
    attempt.scopes = OAuth2Utils::SplitScopes(scope, ',');
    attempt.state = params.state;

    std::optional<std::string> redirect_uri;
    if (config_.options.send_redirect_uri && !config_.oauth2.redirect_uri.empty()) {
        redirect_uri = config_.oauth2.redirect_uri;
    }

    attempt.redirect_url = client_.BuildAuthorizationUrl(scope, redirect_uri, attempt.state);
    attempt.current_state = AttemptState::RequestIssued;

    ErrorContext fields;
    fields.Set("scope", scope)
          .Set("send_redirect_uri", redirect_uri ? "true" : "false")
          .Set("state", attempt.state ? "present" : "absent");
    Log(TraceLevel::INFO, "request_issued", fields);

    return attempt;
}

void AuthStrategy::HandleCallback(AuthAttempt& attempt, const CallbackParams& params) const {
    auto previous_state = attempt.current_state;

    // Results of an earlier callback on the same attempt never survive this one
    attempt.token.reset();
    attempt.profile.reset();
    attempt.test_bypass = false;
    attempt.current_state = AttemptState::CallbackReceived;

    ErrorContext fields;
    fields.Set("variant", UserInfoVariantToString(config_.options.user_info_variant))
          .Set("code", params.code ? "present" : "absent")
          .Set("previous_state", AttemptStateToString(previous_state));
    Log(TraceLevel::INFO, "callback_received", fields);

    if (attempt.state && !attempt.state->empty() && params.state &&
        !OAuth2Utils::ValidateState(*params.state, *attempt.state)) {
        Log(TraceLevel::WARN, "state_mismatch", ErrorContext());
    }

    if (!params.code || params.code->empty()) {
        Fail(attempt, MissingCodeError("No code received"), "callback_failed");
        return;
    }

    if (*params.code == TEST_CODE) {
        attempt.test_bypass = true;
        attempt.current_state = AttemptState::Authenticated;
        Log(TraceLevel::INFO, "test_bypass", ErrorContext());
        return;
    }

    try {
        auto token = client_.ExchangeCode(*params.code);
        if (!token.HasAccessToken()) {
            throw ProviderError(token.OtherParam("error").value_or("token_error"),
                                token.OtherParam("error_description").value_or("No access token received"));
        }
        attempt.token = token;
    } catch (const AuthException& e) {
        Fail(attempt, e, "exchange_failed");
        return;
    }

    try {
        attempt.profile = FetchProfile(*attempt.token, params);
    } catch (const AuthException& e) {
        Fail(attempt, e, "profile_failed");
        return;
    }

    attempt.current_state = AttemptState::Authenticated;

    ErrorContext done;
    done.Set("uid", Uid(attempt).value_or(""));
    Log(TraceLevel::INFO, "authenticated", done);
}

JsonObject AuthStrategy::FetchProfile(const OAuth2Token& token, const CallbackParams& params) const {
    if (config_.options.user_info_variant == UserInfoVariant::direct) {
        return client_.FetchUserInfo(token, config_.options.user_info_url);
    }
    return FetchMiniappProfile(token, params);
}

JsonObject AuthStrategy::FetchMiniappProfile(const OAuth2Token& token, const CallbackParams& params) const {
    std::string missing;
    auto require = [&missing](const char* name, const std::optional<std::string>& value) {
        if (!value) {
            missing += missing.empty() ? name : std::string(", ") + name;
        }
    };
    require("signature", params.signature);
    require("raw_data", params.raw_data);
    require("iv", params.iv);
    require("encrypted_data", params.encrypted_data);
    if (!missing.empty()) {
        throw DataInvalidError("missing miniapp callback parameters: " + missing);
    }

    auto session_key = ResolveSessionKey(token);

    // The signature covers the session key exactly as the provider sent it
    SignatureVerifier::VerifyOrThrow(*params.raw_data, session_key, *params.signature);

    auto context = DecryptionContext::FromBase64(session_key, *params.iv, *params.encrypted_data, *params.raw_data);
    return PayloadDecryptor::Decrypt(context);
}

std::string AuthStrategy::ResolveSessionKey(const OAuth2Token& token) {
    auto session_key = token.other_params.GetString("session_key");
    if (session_key && !session_key->empty()) {
        return *session_key;
    }

    auto encoded = JsonObject::TryParse(token.access_token);
    if (encoded) {
        session_key = encoded->GetString("session_key");
        if (session_key && !session_key->empty()) {
            return *session_key;
        }
    }

    throw DataInvalidError("session_key missing from token");
}

void AuthStrategy::Fail(AuthAttempt& attempt, const AuthException& error, const std::string& event) const {
    attempt.errors.push_back(error.ToAuthError());
    attempt.current_state = AttemptState::Failed;

    ErrorContext fields;
    fields.Set("error", attempt.errors.back().ToString())
          .Set("error_count", std::to_string(attempt.errors.size()));
    Log(error.Kind() == AuthErrorKind::signature_mismatch ? TraceLevel::ERROR : TraceLevel::WARN, event, fields);
}

void AuthStrategy::HandleCleanup(AuthAttempt& attempt) const {
    bool had_data = attempt.token.has_value() || attempt.profile.has_value();
    attempt.token.reset();
    attempt.profile.reset();
    attempt.current_state = AttemptState::CleanedUp;

    if (had_data) {
        Log(TraceLevel::DEBUG_LEVEL, "cleanup", ErrorContext());
    }
}

std::optional<std::string> AuthStrategy::Uid(const AuthAttempt& attempt) const {
    if (!attempt.profile) {
        return std::nullopt;
    }
    return ResultNormalizer::Uid(*attempt.profile, config_.options.uid_field, mapping_);
}

std::optional<Credentials> AuthStrategy::GetCredentials(const AuthAttempt& attempt) const {
    if (!attempt.token) {
        return std::nullopt;
    }
    return ResultNormalizer::ToCredentials(*attempt.token, config_.options.provider_name);
}

std::optional<Info> AuthStrategy::GetInfo(const AuthAttempt& attempt) const {
    if (!attempt.profile) {
        return std::nullopt;
    }
    return ResultNormalizer::ToInfo(*attempt.profile, mapping_);
}

std::optional<RawInfo> AuthStrategy::GetExtra(const AuthAttempt& attempt) const {
    if (!attempt.token || !attempt.profile) {
        return std::nullopt;
    }
    return ResultNormalizer::ToRawInfo(*attempt.token, *attempt.profile);
}

std::optional<AuthResult> AuthStrategy::BuildAuthResult(const AuthAttempt& attempt) const {
    if (!attempt.IsAuthenticated() || attempt.test_bypass || !attempt.token || !attempt.profile) {
        return std::nullopt;
    }

    AuthResult result;
    result.provider = config_.options.provider_name;
    result.uid = Uid(attempt);
    result.credentials = ResultNormalizer::ToCredentials(*attempt.token, config_.options.provider_name);
    result.info = ResultNormalizer::ToInfo(*attempt.profile, mapping_);
    result.extra = ResultNormalizer::ToRawInfo(*attempt.token, *attempt.profile);
    return result;
}

} // namespace feishu_auth
