#pragma once

#include "domain/Session.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstddef>

namespace sessions::ports::output {

/**
 * @brief Исход замены сессии
 */
enum class ReplaceOutcome {
    REPLACED,
    ID_CONFLICT,       // идентификатор преемника занят, можно повторить с новым
    ORIGINAL_MISSING   // заменяемой строки уже нет (удалена или ротирована параллельно)
};

/**
 * @brief Интерфейс постоянного хранилища сессий
 *
 * Все методы при ошибке хранилища бросают domain::StorageException.
 * insert/replace/deleteMany выполняются атомарно (одна транзакция).
 */
class ISessionStore {
public:
    virtual ~ISessionStore() = default;

    /**
     * @brief Вставить новую сессию
     * @return false, если session_id уже занят (нарушение уникальности)
     */
    virtual bool insert(const domain::Session& session) = 0;

    /**
     * @brief Заменить сессию oldId на replacement
     *
     * В одной транзакции: вставка replacement, перенос детей oldId
     * на replacement.sessionId, удаление oldId. Если oldId к моменту
     * замены уже нет, транзакция откатывается и преемник не сохраняется.
     */
    virtual ReplaceOutcome replace(const std::string& oldId, const domain::Session& replacement) = 0;

    virtual std::optional<domain::Session> findById(const std::string& sessionId) = 0;
    virtual std::vector<domain::Session> findByParentId(const std::string& parentId) = 0;
    virtual std::vector<domain::Session> findByIdentity(const std::string& identityKey,
                                                        const std::string& scope) = 0;
    virtual std::vector<domain::Session> findByIdentity(const std::string& identityKey) = 0;

    /**
     * @brief Все сессии с привязанной идентичностью (для обслуживания)
     */
    virtual std::vector<domain::Session> findAllWithIdentity() = 0;

    virtual bool exists(const std::string& sessionId) = 0;
    virtual bool update(const domain::Session& session) = 0;

    /**
     * @brief Удалить набор сессий одной транзакцией
     * @return Идентификаторы реально удалённых строк
     */
    virtual std::vector<std::string> deleteMany(const std::vector<std::string>& sessionIds) = 0;

    /**
     * @brief Удалить все сессии с expires_at < threshold
     */
    virtual std::size_t deleteExpired(std::chrono::system_clock::time_point threshold) = 0;
};

} // namespace sessions::ports::output
