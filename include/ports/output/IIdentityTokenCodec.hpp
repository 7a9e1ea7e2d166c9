#pragma once

#include <string>
#include <optional>

namespace sessions::ports::output {

/**
 * @brief Интерфейс шифрования идентичности (AEAD)
 *
 * Формат токена: base64url(nonce || ciphertext || tag) без '='.
 */
class IIdentityTokenCodec {
public:
    virtual ~IIdentityTokenCodec() = default;

    /**
     * @brief Зашифровать идентичность со свежим случайным nonce
     */
    virtual std::string seal(const std::string& identity) = 0;

    /**
     * @brief Зашифровать с nonce, выведенным из (uniquenessKey, identity)
     *
     * Одинаковые входы дают одинаковый токен. Только для стабильных
     * внешних идентификаторов и ключей поиска.
     */
    virtual std::string sealDeterministic(const std::string& identity,
                                          const std::string& uniquenessKey) = 0;

    /**
     * @brief Расшифровать токен
     * @return std::nullopt при любой ошибке (кодировка, ключ, контекст, подмена)
     */
    virtual std::optional<std::string> open(const std::string& token) = 0;

    /**
     * @brief open + seal с новым nonce
     */
    virtual std::optional<std::string> reseal(const std::string& token) = 0;
};

} // namespace sessions::ports::output
