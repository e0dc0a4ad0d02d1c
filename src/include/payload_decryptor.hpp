#pragma once

#include <string>

#include "json_object.hpp"

namespace feishu_auth {

// Decoded inputs of one verify+decrypt call. Built per callback, never stored.
struct DecryptionContext {
    std::string session_key;   // raw key bytes
    std::string iv;            // raw initialization vector bytes
    std::string ciphertext;    // raw encrypted payload bytes
    std::string raw_data;      // signature input as delivered

    // Each field decodes separately; a failure throws DataCorruptedError naming it
    static DecryptionContext FromBase64(const std::string& session_key_b64,
                                        const std::string& iv_b64,
                                        const std::string& encrypted_data_b64,
                                        const std::string& raw_data);
};

class PayloadDecryptor {
public:
    // AES-128-CBC decrypt, unpad and decode the payload into a JSON object.
    // Throws DataCorruptedError on any failure.
    static JsonObject Decrypt(const DecryptionContext& context);

    // Drops as many trailing bytes as the last byte says; never underflows
    static std::string RemovePadding(const std::string& buffer);

    // Copies unionId to unionid so both casings resolve
    static void AliasUnionId(JsonObject& payload);
};

} // namespace feishu_auth
