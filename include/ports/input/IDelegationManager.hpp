#pragma once

#include "ports/input/SessionResult.hpp"
#include <string>

namespace sessions::ports::input {

/**
 * @brief Делегирование подтверждённой сессии другому scope
 */
class IDelegationManager {
public:
    virtual ~IDelegationManager() = default;

    /**
     * @brief Создать подтверждённую дочернюю сессию под targetScope
     *
     * Существующий ребёнок (parentId, targetScope) заменяется,
     * родитель ротируется.
     */
    virtual DelegationResult delegate(const std::string& parentId,
                                      const std::string& targetScope) = 0;
};

} // namespace sessions::ports::input
