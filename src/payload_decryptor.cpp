#include "payload_decryptor.hpp"
#include "auth_errors.hpp"
#include "crypto_utils.hpp"
#include "feishu_tracing.hpp"

#include <stdexcept>

namespace feishu_auth {

namespace {

std::string DecodeField(const std::string& field_name, const std::string& value) {
    auto decoded = CryptoUtils::Base64Decode(value);
    if (!decoded) {
        FEISHU_TRACE_WARN("PAYLOAD_DECRYPTOR", "Invalid base64 in " + field_name);
        throw DataCorruptedError("invalid base64 in " + field_name);
    }
    return std::move(*decoded);
}

} // anonymous namespace

DecryptionContext DecryptionContext::FromBase64(const std::string& session_key_b64,
                                                const std::string& iv_b64,
                                                const std::string& encrypted_data_b64,
                                                const std::string& raw_data) {
    DecryptionContext context;
    context.session_key = DecodeField("session_key", session_key_b64);
    context.iv = DecodeField("iv", iv_b64);
    context.ciphertext = DecodeField("encrypted_data", encrypted_data_b64);
    context.raw_data = raw_data;
    return context;
}

JsonObject PayloadDecryptor::Decrypt(const DecryptionContext& context) {
    FEISHU_TRACE_DEBUG("PAYLOAD_DECRYPTOR", "Decrypting payload of " + std::to_string(context.ciphertext.size()) + " bytes");

    std::string plaintext;
    try {
        plaintext = CryptoUtils::Aes128CbcDecryptNoPadding(context.session_key, context.iv, context.ciphertext);
    } catch (const std::exception& e) {
        FEISHU_TRACE_WARN("PAYLOAD_DECRYPTOR", std::string("Decryption failed: ") + e.what());
        throw DataCorruptedError(std::string("decryption failed: ") + e.what());
    }

    auto payload = JsonObject::TryParse(RemovePadding(plaintext));
    if (!payload) {
        FEISHU_TRACE_WARN("PAYLOAD_DECRYPTOR", "Decrypted payload is not a JSON object");
        throw DataCorruptedError("data_corrupted");
    }

    AliasUnionId(*payload);

    FEISHU_TRACE_DEBUG("PAYLOAD_DECRYPTOR", "Decrypted payload with " + std::to_string(payload->Size()) + " fields");
    return std::move(*payload);
}

std::string PayloadDecryptor::RemovePadding(const std::string& buffer) {
    if (buffer.empty()) {
        return buffer;
    }
    auto to_remove = static_cast<size_t>(static_cast<unsigned char>(buffer.back()));
    if (to_remove >= buffer.size()) {
        return std::string();
    }
    return buffer.substr(0, buffer.size() - to_remove);
}

void PayloadDecryptor::AliasUnionId(JsonObject& payload) {
    if (payload.Has("unionId")) {
        payload.SetValueFrom("unionid", payload, "unionId");
    }
}

} // namespace feishu_auth
