#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace sessions::settings {

/**
 * @brief Настройки подключения к БД сессий из ENV
 *
 * SESSION_DB_PASSWORD обязателен. Порт и таймаут подключения
 * проверяются при чтении: мусор в ENV — ошибка старта, а не
 * молча урезанное число.
 */
class DbSettings {
public:
    static constexpr int MAX_PORT = 65535;
    static constexpr int MAX_CONNECT_TIMEOUT_SECONDS = 300;

    DbSettings() {
        host_ = getEnvOrDefault("SESSION_DB_HOST", "localhost");
        port_ = parseBoundedInt("SESSION_DB_PORT", getEnvOrDefault("SESSION_DB_PORT", "5432"), MAX_PORT);
        name_ = getEnvOrDefault("SESSION_DB_NAME", "sessions_db");
        user_ = getEnvOrDefault("SESSION_DB_USER", "sessions_user");
        password_ = getEnvOrThrow("SESSION_DB_PASSWORD");
        connectTimeout_ = parseBoundedInt(
            "SESSION_DB_CONNECT_TIMEOUT",
            getEnvOrDefault("SESSION_DB_CONNECT_TIMEOUT", "5"),
            MAX_CONNECT_TIMEOUT_SECONDS
        );

        if (host_.empty()) {
            throw std::runtime_error("SESSION_DB_HOST must not be empty");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    int getConnectTimeout() const { return connectTimeout_; }

    /**
     * @brief Строка подключения libpq (keyword=value)
     */
    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeout_) +
               " application_name=session-maintenance";
    }

    /**
     * @brief Целое в диапазоне [1, max] без знака и посторонних символов
     * @throws std::runtime_error с именем переменной
     */
    static int parseBoundedInt(const char* name, const std::string& value, int max) {
        if (value.empty() || value.size() > 9 ||
            value.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error(std::string(name) + " must be a positive integer, got '" + value + "'");
        }
        int parsed = std::stoi(value);
        if (parsed < 1 || parsed > max) {
            throw std::runtime_error(std::string(name) + " out of range [1, " +
                                     std::to_string(max) + "]: " + value);
        }
        return parsed;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeout_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace sessions::settings
