#pragma once

#include "ports/input/ISessionLifecycleManager.hpp"
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IIdentityTokenCodec.hpp"
#include "ports/output/IRandomSource.hpp"
#include "ports/output/IClock.hpp"
#include "settings/CodecSettings.hpp"
#include "utils/Base64.hpp"
#include <memory>
#include <map>
#include <algorithm>
#include <stdexcept>
#include <iostream>

namespace sessions::application {

/**
 * @brief Итог очистки дубликатов
 */
struct DuplicateCleanupReport {
    std::size_t scanned = 0;   ///< Корневых сессий с идентичностью
    std::size_t unique = 0;    ///< Различных пар (identity, scope)
    std::size_t deleted = 0;   ///< Удалено сессий (без учёта потомков)
    std::size_t skipped = 0;   ///< Токен не расшифровался
};

/**
 * @brief Плановое обслуживание хранилища сессий (запускается по расписанию)
 */
class SessionMaintenance {
public:
    SessionMaintenance(
        std::shared_ptr<ports::input::ISessionLifecycleManager> lifecycle,
        std::shared_ptr<ports::output::ISessionStore> store,
        std::shared_ptr<ports::output::IIdentityTokenCodec> codec,
        std::shared_ptr<ports::output::IClock> clock
    ) : lifecycle_(std::move(lifecycle))
      , store_(std::move(store))
      , codec_(std::move(codec))
      , clock_(std::move(clock))
    {}

    std::size_t purgeExpired() {
        return lifecycle_->deleteExpired(clock_->now());
    }

    /**
     * @brief Оставить по одной (самой новой) сессии на (identity, scope)
     *
     * Рассматриваются только корневые сессии; делегированные удаляются
     * каскадно вместе с родителем.
     */
    DuplicateCleanupReport purgeDuplicates() {
        DuplicateCleanupReport report;
        std::map<std::pair<std::string, std::string>, std::vector<domain::Session>> groups;

        for (const auto& session : store_->findAllWithIdentity()) {
            if (session.isDelegated() || !session.identityToken) {
                continue;
            }
            ++report.scanned;

            auto identity = codec_->open(*session.identityToken);
            if (!identity) {
                ++report.skipped;
                continue;
            }
            groups[{*identity, session.scope}].push_back(session);
        }
        report.unique = groups.size();

        for (auto& [key, sessions] : groups) {
            std::sort(sessions.begin(), sessions.end(),
                [](const domain::Session& a, const domain::Session& b) {
                    return a.createdAt > b.createdAt;
                });
            for (std::size_t i = 1; i < sessions.size(); ++i) {
                if (lifecycle_->deleteSession(sessions[i].sessionId)) {
                    ++report.deleted;
                }
            }
        }

        std::cout << "[SessionMaintenance] Duplicates: scanned=" << report.scanned
                  << " unique=" << report.unique
                  << " deleted=" << report.deleted
                  << " skipped=" << report.skipped << std::endl;
        if (report.skipped > 0) {
            std::cerr << "[SessionMaintenance] " << report.skipped
                      << " sessions carry tokens that do not authenticate" << std::endl;
        }
        return report;
    }

    /**
     * @brief Новый ключ для SESSION_ENCRYPTION_KEY ("base64:<32 байта>")
     */
    static std::string generateEncryptionKey(ports::output::IRandomSource& random) {
        auto bytes = random.randomBytes(settings::CodecSettings::KEY_SIZE);
        if (bytes.size() != settings::CodecSettings::KEY_SIZE) {
            throw std::runtime_error("Random source returned a short key");
        }
        std::string key(bytes.begin(), bytes.end());
        return std::string(settings::CodecSettings::KEY_PREFIX) + utils::base64Encode(key);
    }

private:
    std::shared_ptr<ports::input::ISessionLifecycleManager> lifecycle_;
    std::shared_ptr<ports::output::ISessionStore> store_;
    std::shared_ptr<ports::output::IIdentityTokenCodec> codec_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace sessions::application
