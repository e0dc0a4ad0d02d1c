#pragma once

#include <optional>
#include <string>

namespace feishu_auth {

// Thin OpenSSL EVP helpers. Byte buffers are carried in std::string.
namespace CryptoUtils {
    std::string Base64Encode(const std::string& input);

    // Strict standard-alphabet decode; nullopt on bad length, bad characters
    // or misplaced padding
    std::optional<std::string> Base64Decode(const std::string& input);

    std::string HexEncodeLower(const std::string& bytes);

    std::string Sha1(const std::string& input);
    std::string Sha1HexLower(const std::string& input);

    // AES-128-CBC without cipher padding. Throws std::invalid_argument on wrong
    // key/iv sizes or a ciphertext that is not a whole number of blocks, and
    // std::runtime_error on an OpenSSL failure.
    std::string Aes128CbcDecryptNoPadding(const std::string& key, const std::string& iv, const std::string& ciphertext);

    constexpr size_t AES_128_KEY_SIZE = 16;
    constexpr size_t AES_BLOCK_SIZE = 16;
}

} // namespace feishu_auth
