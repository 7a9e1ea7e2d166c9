#pragma once

#include <string>

namespace sessions::domain {

/**
 * @brief Типизированные отказы операций над сессиями
 *
 * NOT_FOUND намеренно объединяет "нет", "истекла" и "чужой scope":
 * внешний вызывающий не должен их различать.
 */
enum class SessionError {
    NONE,
    NOT_FOUND,          ///< Нет, истекла или недоступна для scope
    INVALID_CODE,       ///< Код не совпал или истёк
    INVALID_PARENT,     ///< Нарушены условия делегирования
    INVALID_INPUT,      ///< Делегирование самому себе и т.п.
    INVALID_SCOPE,      ///< Неизвестный целевой scope
    INVALID_IDENTITY,   ///< Токен идентичности не прошёл аутентификацию
    STORAGE_FAILURE     ///< Ошибка хранилища
};

inline std::string toString(SessionError error) {
    switch (error) {
        case SessionError::NONE:             return "NONE";
        case SessionError::NOT_FOUND:        return "NOT_FOUND";
        case SessionError::INVALID_CODE:     return "INVALID_CODE";
        case SessionError::INVALID_PARENT:   return "INVALID_PARENT";
        case SessionError::INVALID_INPUT:    return "INVALID_INPUT";
        case SessionError::INVALID_SCOPE:    return "INVALID_SCOPE";
        case SessionError::INVALID_IDENTITY: return "INVALID_IDENTITY";
        case SessionError::STORAGE_FAILURE:  return "STORAGE_FAILURE";
        default: return "UNKNOWN";
    }
}

} // namespace sessions::domain
