#include "crypto_utils.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace feishu_auth {

namespace CryptoUtils {

std::string Base64Encode(const std::string& input) {
    if (input.empty()) {
        return "";
    }
    std::string result;
    result.resize(4 * ((input.size() + 2) / 3));
    auto written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                   reinterpret_cast<const unsigned char*>(input.data()),
                                   static_cast<int>(input.size()));
    result.resize(static_cast<size_t>(written));
    return result;
}

static bool IsBase64Char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::optional<std::string> Base64Decode(const std::string& input) {
    if (input.empty()) {
        return std::string();
    }
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t padding = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c == '=') {
            // Padding is only legal in the last two positions
            if (i < input.size() - 2) {
                return std::nullopt;
            }
            ++padding;
        } else if (!IsBase64Char(c) || padding > 0) {
            return std::nullopt;
        }
    }

    std::string result;
    result.resize(3 * (input.size() / 4));
    auto decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                   reinterpret_cast<const unsigned char*>(input.data()),
                                   static_cast<int>(input.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }
    result.resize(static_cast<size_t>(decoded) - padding);
    return result;
}

std::string HexEncodeLower(const std::string& bytes) {
    static const char* HEX_DIGITS = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        hex += HEX_DIGITS[c >> 4];
        hex += HEX_DIGITS[c & 0x0F];
    }
    return hex;
}

std::string Sha1(const std::string& input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1) {
        throw std::runtime_error("SHA-1 digest computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string Sha1HexLower(const std::string& input) {
    return HexEncodeLower(Sha1(input));
}

std::string Aes128CbcDecryptNoPadding(const std::string& key, const std::string& iv, const std::string& ciphertext) {
    if (key.size() != AES_128_KEY_SIZE) {
        throw std::invalid_argument("AES-128 key must be 16 bytes, got " + std::to_string(key.size()));
    }
    if (iv.size() != AES_BLOCK_SIZE) {
        throw std::invalid_argument("AES-CBC iv must be 16 bytes, got " + std::to_string(iv.size()));
    }
    if (ciphertext.empty() || ciphertext.size() % AES_BLOCK_SIZE != 0) {
        throw std::invalid_argument("Ciphertext length " + std::to_string(ciphertext.size()) +
                                    " is not a positive multiple of the AES block size");
    }

    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           reinterpret_cast<const unsigned char*>(key.data()),
                           reinterpret_cast<const unsigned char*>(iv.data())) != 1) {
        throw std::runtime_error("Failed to initialize AES-128-CBC decryption");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    std::string plaintext;
    plaintext.resize(ciphertext.size() + AES_BLOCK_SIZE);
    int out_len = 0;
    if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&plaintext[0]), &out_len,
                          reinterpret_cast<const unsigned char*>(ciphertext.data()),
                          static_cast<int>(ciphertext.size())) != 1) {
        throw std::runtime_error("AES-128-CBC decryption failed");
    }

    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&plaintext[0]) + out_len, &final_len) != 1) {
        throw std::runtime_error("AES-128-CBC finalization failed");
    }

    plaintext.resize(static_cast<size_t>(out_len + final_len));
    return plaintext;
}

} // namespace CryptoUtils

} // namespace feishu_auth
