#pragma once

#include "ports/output/IScopeRegistry.hpp"
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <fstream>
#include <stdexcept>
#include <iostream>

namespace sessions::adapters::secondary {

/**
 * @brief Реестр scope из JSON-файла
 *
 * Формат:
 * ```json
 * {"scopes": [{"key": "k-portal", "name": "Portal"}]}
 * ```
 */
class JsonScopeRegistry : public ports::output::IScopeRegistry {
public:
    /**
     * @throws std::runtime_error если файл не читается или формат неверный
     */
    explicit JsonScopeRegistry(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("Cannot open scopes file: " + path);
        }

        try {
            load(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid scopes file " + path + ": " + e.what());
        }

        std::cout << "[JsonScopeRegistry] Loaded " << scopes_.size()
                  << " scopes from " << path << std::endl;
    }

    bool isKnownScope(const std::string& scope) const override {
        return scopes_.count(scope) > 0;
    }

    std::optional<std::string> getScopeName(const std::string& scope) const override {
        auto it = scopes_.find(scope);
        if (it == scopes_.end()) return std::nullopt;
        return it->second;
    }

private:
    std::unordered_map<std::string, std::string> scopes_;  // key -> name

    void load(const nlohmann::json& config) {
        const auto& entries = config.at("scopes");
        if (!entries.is_array()) {
            throw std::runtime_error("'scopes' must be an array");
        }
        for (const auto& entry : entries) {
            std::string key = entry.at("key").get<std::string>();
            if (key.empty()) {
                throw std::runtime_error("Scope key must not be empty");
            }
            scopes_[key] = entry.value("name", key);
        }
    }
};

} // namespace sessions::adapters::secondary
