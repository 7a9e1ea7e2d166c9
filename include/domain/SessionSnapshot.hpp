#pragma once

#include "domain/Session.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace sessions::domain {

/**
 * @brief Публичное представление сессии для транспортного слоя
 *
 * Не содержит ни токена идентичности, ни кода подтверждения.
 */
struct SessionSnapshot {
    std::string sessionId;
    std::chrono::system_clock::time_point expiresAt;
    bool validated = false;
    std::string scope;
    std::optional<std::string> parentId;

    static SessionSnapshot fromSession(const Session& session) {
        SessionSnapshot snapshot;
        snapshot.sessionId = session.sessionId;
        snapshot.expiresAt = session.expiresAt;
        snapshot.validated = session.validated;
        snapshot.scope = session.scope;
        snapshot.parentId = session.parentId;
        return snapshot;
    }

    nlohmann::json toJson() const {
        nlohmann::json json;
        json["session_id"] = sessionId;
        json["expires_at"] = Timestamp(expiresAt).toString();
        json["validated"] = validated;
        json["scope"] = scope;
        if (parentId) {
            json["parent_id"] = *parentId;
        } else {
            json["parent_id"] = nullptr;
        }
        return json;
    }
};

} // namespace sessions::domain
