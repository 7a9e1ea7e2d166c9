#pragma once

#include "utils/Base64.hpp"
#include <string>
#include <cstdlib>
#include <stdexcept>

namespace sessions::settings {

/**
 * @brief Настройки шифрования идентичности
 *
 * Читает из ENV:
 * - SESSION_ENCRYPTION_KEY (обязательно, формат "base64:<32 байта>")
 * - SESSION_TOKEN_CONTEXT (default: identity-sessions)
 */
class CodecSettings {
public:
    static constexpr const char* KEY_PREFIX = "base64:";
    static constexpr std::size_t KEY_SIZE = 32;

    CodecSettings() {
        const char* raw = std::getenv("SESSION_ENCRYPTION_KEY");
        if (!raw) {
            throw std::runtime_error("Required env variable not set: SESSION_ENCRYPTION_KEY");
        }
        key_ = parseKey(raw);

        if (const char* val = std::getenv("SESSION_TOKEN_CONTEXT")) {
            context_ = val;
        }
    }

    const std::string& getKey() const { return key_; }
    const std::string& getContext() const { return context_; }

    /**
     * @brief Разобрать "base64:<...>" в 32 байта ключа
     * @throws std::runtime_error при неверном префиксе, кодировке или длине
     */
    static std::string parseKey(const std::string& value) {
        const std::string prefix = KEY_PREFIX;
        if (value.compare(0, prefix.size(), prefix) != 0) {
            throw std::runtime_error("SESSION_ENCRYPTION_KEY must start with 'base64:'");
        }
        auto key = utils::base64Decode(value.substr(prefix.size()));
        if (!key || key->size() != KEY_SIZE) {
            throw std::runtime_error("SESSION_ENCRYPTION_KEY must encode exactly 32 bytes");
        }
        return *key;
    }

private:
    std::string key_;
    std::string context_ = "identity-sessions";
};

} // namespace sessions::settings
