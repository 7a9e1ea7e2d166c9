// src/adapters/secondary/AeadIdentityTokenCodec.cpp
#include "adapters/secondary/AeadIdentityTokenCodec.hpp"
#include "utils/Base64.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/hmac.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <cstdint>
#include <vector>
#include <utility>

namespace sessions::adapters::secondary {

namespace {

struct EvpCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherCtxDeleter>;

std::string openSslError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(err, buffer, sizeof(buffer));
    return buffer;
}

const unsigned char* bytes(const std::string& s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             bytes(data), data.size(), digest, &digestLen) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 failed: " + openSslError());
    }
    return std::string(reinterpret_cast<const char*>(digest), digestLen);
}

} // namespace

AeadIdentityTokenCodec::AeadIdentityTokenCodec(
    std::string key,
    std::string context,
    std::shared_ptr<ports::output::IRandomSource> random
) : key_(std::move(key))
  , context_(std::move(context))
  , random_(std::move(random))
{
    if (key_.size() != KEY_SIZE) {
        throw std::invalid_argument("Identity token key must be 32 bytes, got " +
                                    std::to_string(key_.size()));
    }
    if (!random_) {
        throw std::invalid_argument("Identity token codec requires a random source");
    }
    nonceKey_ = hmacSha256(key_, "identity-sessions/nonce");
}

AeadIdentityTokenCodec::~AeadIdentityTokenCodec() {
    OPENSSL_cleanse(key_.data(), key_.size());
    OPENSSL_cleanse(nonceKey_.data(), nonceKey_.size());
}

std::string AeadIdentityTokenCodec::seal(const std::string& identity) {
    auto nonceBytes = random_->randomBytes(NONCE_SIZE);
    if (nonceBytes.size() != NONCE_SIZE) {
        throw std::runtime_error("Random source returned a short nonce");
    }
    std::string nonce(nonceBytes.begin(), nonceBytes.end());
    return sealWithNonce(nonce, identity);
}

std::string AeadIdentityTokenCodec::sealDeterministic(
    const std::string& identity,
    const std::string& uniquenessKey
) {
    return sealWithNonce(deriveNonce(identity, uniquenessKey), identity);
}

std::optional<std::string> AeadIdentityTokenCodec::open(const std::string& token) {
    auto raw = utils::base64UrlDecode(token);
    if (!raw || raw->size() < NONCE_SIZE + TAG_SIZE) {
        return std::nullopt;
    }

    const std::string nonce = raw->substr(0, NONCE_SIZE);
    const std::size_t ciphertextLen = raw->size() - NONCE_SIZE - TAG_SIZE;
    const std::string ciphertext = raw->substr(NONCE_SIZE, ciphertextLen);
    std::string tag = raw->substr(NONCE_SIZE + ciphertextLen);

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }

    int outLen = 0;
    if (!context_.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &outLen, bytes(context_),
                          static_cast<int>(context_.size())) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }

    std::vector<unsigned char> plaintext(ciphertextLen + 1);
    int plaintextLen = 0;
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &outLen, bytes(ciphertext),
                          static_cast<int>(ciphertextLen)) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        ERR_clear_error();
        return std::nullopt;
    }
    plaintextLen = outLen;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_TAG,
                            static_cast<int>(TAG_SIZE), tag.data()) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        ERR_clear_error();
        return std::nullopt;
    }

    // Проверка тега: любая подмена, чужой ключ или контекст
    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLen, &finalLen) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        ERR_clear_error();
        return std::nullopt;
    }
    plaintextLen += finalLen;

    std::string identity(reinterpret_cast<const char*>(plaintext.data()),
                         static_cast<std::size_t>(plaintextLen));
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    return identity;
}

std::optional<std::string> AeadIdentityTokenCodec::reseal(const std::string& token) {
    auto identity = open(token);
    if (!identity) {
        return std::nullopt;
    }
    std::string resealed = seal(*identity);
    OPENSSL_cleanse(identity->data(), identity->size());
    return resealed;
}

std::string AeadIdentityTokenCodec::sealWithNonce(
    const std::string& nonce,
    const std::string& identity
) const {
    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw std::runtime_error("Failed to create cipher context: " + openSslError());
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
        throw std::runtime_error("Failed to initialize ChaCha20-Poly1305: " + openSslError());
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_SET_IVLEN,
                            static_cast<int>(NONCE_SIZE), nullptr) != 1) {
        throw std::runtime_error("Failed to set nonce length: " + openSslError());
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, bytes(key_), bytes(nonce)) != 1) {
        throw std::runtime_error("Failed to set key and nonce: " + openSslError());
    }

    int outLen = 0;
    if (!context_.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &outLen, bytes(context_),
                          static_cast<int>(context_.size())) != 1) {
        throw std::runtime_error("Failed to add associated data: " + openSslError());
    }

    std::vector<unsigned char> output(identity.size() + TAG_SIZE + 1);
    int ciphertextLen = 0;
    if (EVP_EncryptUpdate(ctx.get(), output.data(), &outLen, bytes(identity),
                          static_cast<int>(identity.size())) != 1) {
        throw std::runtime_error("Encryption failed: " + openSslError());
    }
    ciphertextLen = outLen;

    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), output.data() + ciphertextLen, &finalLen) != 1) {
        throw std::runtime_error("Encryption finalization failed: " + openSslError());
    }
    ciphertextLen += finalLen;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_AEAD_GET_TAG,
                            static_cast<int>(TAG_SIZE), output.data() + ciphertextLen) != 1) {
        throw std::runtime_error("Failed to get authentication tag: " + openSslError());
    }

    std::string raw = nonce;
    raw.append(reinterpret_cast<const char*>(output.data()),
               static_cast<std::size_t>(ciphertextLen) + TAG_SIZE);
    return utils::base64UrlEncode(raw);
}

std::string AeadIdentityTokenCodec::deriveNonce(
    const std::string& identity,
    const std::string& uniquenessKey
) const {
    // Длина ключа уникальности перед ним: ("ab", "c") и ("a", "bc") не совпадут
    std::string material;
    uint64_t len = uniquenessKey.size();
    for (int shift = 56; shift >= 0; shift -= 8) {
        material.push_back(static_cast<char>((len >> shift) & 0xFF));
    }
    material += uniquenessKey;
    material += identity;

    std::string digest = hmacSha256(nonceKey_, material);
    OPENSSL_cleanse(material.data(), material.size());
    return digest.substr(0, NONCE_SIZE);
}

} // namespace sessions::adapters::secondary
