#pragma once

#include <stdexcept>
#include <string>

namespace sessions::domain {

/**
 * @brief Исключение, выбрасываемое хранилищем сессий при ошибках БД
 *
 * Не перехватывается менеджерами: незавершённый каскад или ротация
 * должны дойти до транспортного слоя как STORAGE_FAILURE.
 */
class StorageException : public std::runtime_error {
public:
    explicit StorageException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace sessions::domain
