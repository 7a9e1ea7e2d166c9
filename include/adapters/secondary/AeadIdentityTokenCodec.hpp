#pragma once

#include "ports/output/IIdentityTokenCodec.hpp"
#include "ports/output/IRandomSource.hpp"
#include <memory>
#include <string>
#include <optional>
#include <cstddef>

namespace sessions::adapters::secondary {

/**
 * @brief ChaCha20-Poly1305 (OpenSSL EVP) шифрование идентичности
 *
 * Токен: base64url(nonce[12] || ciphertext || tag[16]) без '='.
 * Ассоциированные данные — фиксированная строка контекста, поэтому токен
 * другого приложения с тем же ключом не откроется.
 *
 * Детерминированный nonce = HMAC-SHA256(nonceKey, len(uk) || uk || identity)[0..12),
 * где nonceKey = HMAC-SHA256(key, "identity-sessions/nonce").
 */
class AeadIdentityTokenCodec : public ports::output::IIdentityTokenCodec {
public:
    static constexpr std::size_t KEY_SIZE = 32;
    static constexpr std::size_t NONCE_SIZE = 12;
    static constexpr std::size_t TAG_SIZE = 16;

    /**
     * @param key 32 байта (бинарно)
     * @param context Ассоциированные данные (должны совпадать при open)
     * @throws std::invalid_argument если размер ключа неверный
     */
    AeadIdentityTokenCodec(std::string key,
                           std::string context,
                           std::shared_ptr<ports::output::IRandomSource> random);

    ~AeadIdentityTokenCodec() override;

    std::string seal(const std::string& identity) override;

    std::string sealDeterministic(const std::string& identity,
                                  const std::string& uniquenessKey) override;

    std::optional<std::string> open(const std::string& token) override;

    std::optional<std::string> reseal(const std::string& token) override;

private:
    std::string key_;
    std::string nonceKey_;
    std::string context_;
    std::shared_ptr<ports::output::IRandomSource> random_;

    std::string sealWithNonce(const std::string& nonce, const std::string& identity) const;
    std::string deriveNonce(const std::string& identity, const std::string& uniquenessKey) const;
};

} // namespace sessions::adapters::secondary
