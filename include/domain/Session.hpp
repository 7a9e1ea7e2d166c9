#pragma once

#include <string>
#include <chrono>
#include <optional>

namespace sessions::domain {

/**
 * @brief Серверная сессия, замещающая внешнюю идентичность пользователя
 *
 * Идентичность хранится только в виде AEAD-шифротекста (identityToken).
 * Сессия создаётся неподтверждённой (с одноразовым кодом), после проверки
 * кода ротируется в подтверждённую. Делегированные сессии ссылаются на
 * родителя через parentId (глубина дерева не больше 1).
 */
struct Session {
    std::string sessionId;                        ///< Случайный идентификатор (32 символа, base32)
    std::optional<std::string> identityToken;     ///< Шифротекст идентичности (свежий nonce)
    std::optional<std::string> identityKey;       ///< Детерминированный шифротекст для поиска
    std::string code;                             ///< 6-значный код подтверждения
    std::chrono::system_clock::time_point codeExpiresAt;
    std::chrono::system_clock::time_point expiresAt;
    std::chrono::seconds duration{0};             ///< TTL для продления и ротации
    bool validated = false;
    std::chrono::system_clock::time_point createdAt;
    std::string scope;                            ///< API-ключ, под которым создана сессия
    std::optional<std::string> parentId;          ///< Родитель (для делегированных)

    Session() = default;

    /**
     * @brief Проверить, истекла ли сессия к моменту now
     */
    bool isExpired(std::chrono::system_clock::time_point now) const {
        return now >= expiresAt;
    }

    bool isCodeExpired(std::chrono::system_clock::time_point now) const {
        return now >= codeExpiresAt;
    }

    bool isDelegated() const {
        return parentId.has_value();
    }
};

} // namespace sessions::domain
