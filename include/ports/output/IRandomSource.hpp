#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace sessions::ports::output {

/**
 * @brief Криптостойкий источник случайных байт
 *
 * Используется для nonce, идентификаторов сессий и кодов.
 * @throws std::runtime_error если генератор недоступен
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    virtual std::vector<uint8_t> randomBytes(std::size_t count) = 0;
};

} // namespace sessions::ports::output
