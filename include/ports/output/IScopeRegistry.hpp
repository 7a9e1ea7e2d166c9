#pragma once

#include <string>
#include <optional>

namespace sessions::ports::output {

/**
 * @brief Реестр известных scope (API-ключей)
 */
class IScopeRegistry {
public:
    virtual ~IScopeRegistry() = default;

    virtual bool isKnownScope(const std::string& scope) const = 0;

    /**
     * @brief Человекочитаемое имя scope
     */
    virtual std::optional<std::string> getScopeName(const std::string& scope) const = 0;
};

} // namespace sessions::ports::output
