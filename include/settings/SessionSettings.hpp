#pragma once

#include <cstdlib>
#include <string>
#include <chrono>

namespace sessions::settings {

/**
 * @brief Настройки жизненного цикла сессий
 *
 * Читает из ENV:
 * - SESSION_LIFETIME (default: 1800)
 * - SESSION_CODE_VALIDITY (default: 300)
 * - SESSION_DELEGATED_LIFETIME (default: 1800)
 * - SESSION_SCOPES_FILE (default: config/scopes.json)
 */
class SessionSettings {
public:
    SessionSettings() {
        if (const char* val = std::getenv("SESSION_LIFETIME")) {
            sessionLifetimeSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("SESSION_CODE_VALIDITY")) {
            codeValiditySeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("SESSION_DELEGATED_LIFETIME")) {
            delegatedLifetimeSeconds_ = std::stoi(val);
        }
        if (const char* val = std::getenv("SESSION_SCOPES_FILE")) {
            scopesFile_ = val;
        }
    }

    std::chrono::seconds getSessionLifetime() const {
        return std::chrono::seconds(sessionLifetimeSeconds_);
    }
    std::chrono::seconds getCodeValidity() const {
        return std::chrono::seconds(codeValiditySeconds_);
    }
    std::chrono::seconds getDelegatedLifetime() const {
        return std::chrono::seconds(delegatedLifetimeSeconds_);
    }
    std::string getScopesFile() const { return scopesFile_; }

private:
    int sessionLifetimeSeconds_ = 1800;
    int codeValiditySeconds_ = 300;
    int delegatedLifetimeSeconds_ = 1800;
    std::string scopesFile_ = "config/scopes.json";
};

} // namespace sessions::settings
