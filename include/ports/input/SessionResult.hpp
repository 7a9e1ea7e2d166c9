#pragma once

#include "domain/Session.hpp"
#include "domain/SessionError.hpp"
#include <string>
#include <utility>

namespace sessions::ports::input {

/**
 * @brief Результат операции над сессией
 *
 * При success == true поле session содержит актуальное состояние,
 * иначе error указывает тип отказа.
 */
struct SessionResult {
    bool success = false;
    domain::Session session;
    domain::SessionError error = domain::SessionError::NONE;
    std::string message;

    static SessionResult ok(domain::Session session) {
        SessionResult result;
        result.success = true;
        result.session = std::move(session);
        return result;
    }

    static SessionResult fail(domain::SessionError error, std::string message) {
        SessionResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

/**
 * @brief Результат делегирования
 *
 * parent — ротированный родитель (старый идентификатор больше не действует).
 */
struct DelegationResult {
    bool success = false;
    domain::Session child;
    domain::Session parent;
    domain::SessionError error = domain::SessionError::NONE;
    std::string message;

    static DelegationResult fail(domain::SessionError error, std::string message) {
        DelegationResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

} // namespace sessions::ports::input
