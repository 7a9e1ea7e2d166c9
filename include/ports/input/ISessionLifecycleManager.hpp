#pragma once

#include "ports/input/SessionResult.hpp"
#include "domain/Session.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

namespace sessions::ports::input {

/**
 * @brief Жизненный цикл сессий
 *
 * Unvalidated → Validated (через проверку кода и ротацию) → Deleted.
 * Истечение обнаруживается лениво при чтении.
 */
class ISessionLifecycleManager {
public:
    virtual ~ISessionLifecycleManager() = default;

    /**
     * @brief Создать неподтверждённую сессию со свежим кодом
     * @param supersedes Сессия, которую новая заменяет (дети переносятся);
     *        если её уже нет, результат NOT_FOUND и ничего не создаётся
     */
    virtual SessionResult create(
        const std::string& scope,
        std::chrono::seconds duration,
        std::chrono::seconds codeValidity,
        const std::optional<std::string>& supersedes = std::nullopt
    ) = 0;

    /**
     * @brief То же с TTL и сроком кода по умолчанию
     */
    virtual SessionResult create(const std::string& scope) = 0;

    /**
     * @brief Привязать (перезаписать) шифротекст идентичности
     */
    virtual SessionResult setIdentity(const std::string& sessionId,
                                      const std::string& encryptedToken) = 0;

    /**
     * @brief Проверить код без изменения состояния
     */
    virtual bool checkCode(const std::string& sessionId, const std::string& code) = 0;

    virtual bool markValidated(const std::string& sessionId) = 0;

    /**
     * @brief Проверить код и ротировать в подтверждённую сессию
     */
    virtual SessionResult validate(const std::string& sessionId, const std::string& code) = 0;

    /**
     * @brief Новый идентификатор, validated/duration/parent копируются
     *
     * Токен идентичности не копируется: вызывающий обязан перешифровать
     * его и вызвать setIdentity.
     */
    virtual SessionResult rotate(const std::string& oldId, const std::string& newScope) = 0;

    /**
     * @brief Ротация под тем же scope вместе с перешифрованной идентичностью
     */
    virtual SessionResult refresh(const std::string& sessionId) = 0;

    /**
     * @brief Продлить expires_at от текущего момента (идентификатор не меняется)
     */
    virtual SessionResult touch(const std::string& sessionId, std::chrono::seconds duration) = 0;
    virtual SessionResult touch(const std::string& sessionId) = 0;

    virtual SessionResult regenerateCode(const std::string& sessionId,
                                         std::chrono::seconds codeValidity) = 0;

    virtual bool isActive(const std::string& sessionId) = 0;
    virtual bool isValidated(const std::string& sessionId) = 0;

    /**
     * @brief Получить живую сессию (с проверкой родителя)
     */
    virtual std::optional<domain::Session> get(const std::string& sessionId) = 0;

    virtual std::vector<domain::Session> children(const std::string& parentId) = 0;

    /**
     * @brief Создать подтверждённого ребёнка parent под scope
     *
     * Предусловия делегирования проверяет вызывающий.
     */
    virtual SessionResult createDelegated(
        const domain::Session& parent,
        const std::string& scope,
        const std::string& identityToken,
        std::chrono::seconds duration
    ) = 0;

    /**
     * @brief Каскадно удалить сессию вместе с потомками
     * @return true, если сама сессия существовала
     */
    virtual bool deleteSession(const std::string& sessionId) = 0;

    virtual std::size_t deleteByIdentity(const std::string& identity) = 0;

    virtual std::size_t deleteExpired(std::chrono::system_clock::time_point threshold) = 0;

    virtual bool checkAccess(const std::string& sessionId, const std::string& callerScope) = 0;
};

} // namespace sessions::ports::input
