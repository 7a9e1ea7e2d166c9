#pragma once

#include "ports/input/ISessionLifecycleManager.hpp"
#include "ports/output/ISessionStore.hpp"
#include "ports/output/IIdentityTokenCodec.hpp"
#include "ports/output/IRandomSource.hpp"
#include "ports/output/IClock.hpp"
#include "settings/SessionSettings.hpp"
#include "domain/StorageException.hpp"
#include <memory>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <unordered_set>

namespace sessions::application {

/**
 * @brief Менеджер жизненного цикла сессий
 *
 * Все изменения идут через ISessionStore; ротация — одна атомарная
 * операция replace (новая строка + перенос детей + удаление старой).
 * Идентификатор генерируется заново при конфликте уникальности.
 * Если заменяемую строку уже ротировали параллельно, операция
 * завершается NOT_FOUND: у одной логической сессии один преемник.
 *
 * touch продлевает expires_at на месте, идентификатор сохраняется.
 * Смена идентификатора — только через rotate/refresh/validate.
 */
class SessionLifecycleManager : public ports::input::ISessionLifecycleManager {
public:
    static constexpr std::size_t SESSION_ID_LENGTH = 32;
    static constexpr int MAX_ID_ATTEMPTS = 16;
    static constexpr std::size_t MAX_DELEGATION_DEPTH = 1;
    static constexpr uint32_t CODE_RANGE = 1000000;
    static constexpr const char* IDENTITY_LOOKUP_KEY = "identity-lookup";

    SessionLifecycleManager(
        std::shared_ptr<settings::SessionSettings> settings,
        std::shared_ptr<ports::output::ISessionStore> store,
        std::shared_ptr<ports::output::IIdentityTokenCodec> codec,
        std::shared_ptr<ports::output::IRandomSource> random,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , store_(std::move(store))
      , codec_(std::move(codec))
      , random_(std::move(random))
      , clock_(std::move(clock))
    {
        std::cout << "[SessionLifecycleManager] Created" << std::endl;
    }

    /**
     * @brief Создать сессию с TTL и сроком кода из настроек
     */
    ports::input::SessionResult create(const std::string& scope) override {
        return create(scope, settings_->getSessionLifetime(), settings_->getCodeValidity());
    }

    ports::input::SessionResult create(
        const std::string& scope,
        std::chrono::seconds duration,
        std::chrono::seconds codeValidity,
        const std::optional<std::string>& supersedes = std::nullopt
    ) override {
        if (scope.empty()) {
            return fail(domain::SessionError::INVALID_INPUT, "Scope required");
        }
        if (duration.count() <= 0) {
            return fail(domain::SessionError::INVALID_INPUT, "Session duration must be positive");
        }

        domain::Session session = newSession(scope, duration, codeValidity);
        if (!issue(session, supersedes)) {
            return notFound();
        }

        std::cout << "[SessionLifecycleManager] Created session " << shortId(session.sessionId);
        if (supersedes) {
            std::cout << " replacing " << shortId(*supersedes);
        }
        std::cout << std::endl;

        return ports::input::SessionResult::ok(session);
    }

    ports::input::SessionResult setIdentity(
        const std::string& sessionId,
        const std::string& encryptedToken
    ) override {
        auto session = get(sessionId);
        if (!session) {
            return notFound();
        }

        auto identity = codec_->open(encryptedToken);
        if (!identity) {
            std::cerr << "[SessionLifecycleManager] Rejected identity token for "
                      << shortId(sessionId) << std::endl;
            return fail(domain::SessionError::INVALID_IDENTITY, "Identity token does not authenticate");
        }
        std::string identityKey = codec_->sealDeterministic(*identity, IDENTITY_LOOKUP_KEY);

        // Одна неподтверждённая сессия на (identity, scope): новая вытесняет старые
        if (!session->validated) {
            for (const auto& other : store_->findByIdentity(identityKey, session->scope)) {
                if (other.sessionId != sessionId && !other.validated) {
                    deleteSubtree(other.sessionId);
                    std::cout << "[SessionLifecycleManager] Superseded pending session "
                              << shortId(other.sessionId) << std::endl;
                }
            }
        }

        session->identityToken = encryptedToken;
        session->identityKey = identityKey;
        if (!store_->update(*session)) {
            return notFound();
        }
        return ports::input::SessionResult::ok(*session);
    }

    bool checkCode(const std::string& sessionId, const std::string& code) override {
        auto session = store_->findById(sessionId);
        if (!session) {
            return false;
        }

        auto now = clock_->now();
        if (session->isExpired(now) || session->validated || session->isCodeExpired(now)) {
            return false;
        }
        return constantTimeEquals(session->code, code);
    }

    bool markValidated(const std::string& sessionId) override {
        auto session = get(sessionId);
        if (!session) {
            return false;
        }
        if (!session->identityToken) {
            std::cerr << "[SessionLifecycleManager] Cannot validate " << shortId(sessionId)
                      << ": no identity attached" << std::endl;
            return false;
        }
        if (session->validated) {
            return true;
        }
        session->validated = true;
        return store_->update(*session);
    }

    ports::input::SessionResult validate(
        const std::string& sessionId,
        const std::string& code
    ) override {
        auto session = get(sessionId);
        if (!session) {
            return notFound();
        }
        if (!checkCode(sessionId, code)) {
            return fail(domain::SessionError::INVALID_CODE, "Invalid or expired code");
        }
        if (!session->identityToken) {
            return fail(domain::SessionError::INVALID_IDENTITY, "Session has no identity");
        }

        auto resealed = codec_->reseal(*session->identityToken);
        if (!resealed) {
            return fail(domain::SessionError::INVALID_IDENTITY, "Identity token does not authenticate");
        }

        domain::Session next = successorOf(*session, session->scope);
        next.validated = true;
        next.identityToken = *resealed;
        next.identityKey = session->identityKey;
        if (!issue(next, sessionId)) {
            return notFound();
        }

        std::cout << "[SessionLifecycleManager] Validated " << shortId(sessionId)
                  << " -> " << shortId(next.sessionId) << std::endl;
        return ports::input::SessionResult::ok(next);
    }

    ports::input::SessionResult rotate(
        const std::string& oldId,
        const std::string& newScope
    ) override {
        if (newScope.empty()) {
            return fail(domain::SessionError::INVALID_INPUT, "Scope required");
        }
        auto old = get(oldId);
        if (!old) {
            return notFound();
        }

        domain::Session next = successorOf(*old, newScope);
        if (!issue(next, oldId)) {
            return notFound();
        }

        std::cout << "[SessionLifecycleManager] Rotated " << shortId(oldId)
                  << " -> " << shortId(next.sessionId) << std::endl;
        return ports::input::SessionResult::ok(next);
    }

    ports::input::SessionResult refresh(const std::string& sessionId) override {
        auto old = get(sessionId);
        if (!old) {
            return notFound();
        }
        if (!old->identityToken) {
            return fail(domain::SessionError::INVALID_IDENTITY, "Session has no identity");
        }

        auto resealed = codec_->reseal(*old->identityToken);
        if (!resealed) {
            return fail(domain::SessionError::INVALID_IDENTITY, "Identity token does not authenticate");
        }

        domain::Session next = successorOf(*old, old->scope);
        next.identityToken = *resealed;
        next.identityKey = old->identityKey;
        if (!issue(next, sessionId)) {
            return notFound();
        }

        std::cout << "[SessionLifecycleManager] Refreshed " << shortId(sessionId)
                  << " -> " << shortId(next.sessionId) << std::endl;
        return ports::input::SessionResult::ok(next);
    }

    ports::input::SessionResult touch(
        const std::string& sessionId,
        std::chrono::seconds duration
    ) override {
        if (duration.count() <= 0) {
            return fail(domain::SessionError::INVALID_INPUT, "Session duration must be positive");
        }
        auto session = get(sessionId);
        if (!session) {
            return notFound();
        }
        return extend(*session, duration);
    }

    ports::input::SessionResult touch(const std::string& sessionId) override {
        auto session = get(sessionId);
        if (!session) {
            return notFound();
        }
        return extend(*session, session->duration);
    }

    ports::input::SessionResult regenerateCode(
        const std::string& sessionId,
        std::chrono::seconds codeValidity
    ) override {
        auto session = get(sessionId);
        if (!session) {
            return notFound();
        }
        if (session->validated) {
            return fail(domain::SessionError::INVALID_INPUT, "Session already validated");
        }

        session->code = generateCode();
        session->codeExpiresAt = clock_->now() + codeValidity;
        if (!store_->update(*session)) {
            return notFound();
        }
        return ports::input::SessionResult::ok(*session);
    }

    bool isActive(const std::string& sessionId) override {
        auto session = store_->findById(sessionId);
        if (!session) {
            return false;
        }
        if (session->isExpired(clock_->now())) {
            deleteSubtree(sessionId);
            return false;
        }
        return true;
    }

    bool isValidated(const std::string& sessionId) override {
        auto session = get(sessionId);
        return session && session->validated;
    }

    /**
     * @brief Получить живую сессию
     *
     * Подъём к корню итеративный и ограничен MAX_DELEGATION_DEPTH:
     * истёкший или пропавший предок удаляет запрошенную сессию.
     * Цепочка длиннее допустимой считается аномалией хранилища
     * и тоже приводит к удалению.
     */
    std::optional<domain::Session> get(const std::string& sessionId) override {
        const auto now = clock_->now();
        std::optional<domain::Session> requested;
        std::optional<std::string> cursor = sessionId;

        for (std::size_t depth = 0; cursor; ++depth) {
            if (depth > MAX_DELEGATION_DEPTH) {
                std::cerr << "[SessionLifecycleManager] Delegation chain of " << shortId(sessionId)
                          << " exceeds depth " << MAX_DELEGATION_DEPTH << ", revoking" << std::endl;
                deleteSubtree(sessionId);
                return std::nullopt;
            }

            auto row = store_->findById(*cursor);
            if (!row) {
                if (depth > 0) {
                    deleteSubtree(sessionId);
                }
                return std::nullopt;
            }
            if (row->isExpired(now)) {
                deleteSubtree(row->sessionId);
                if (depth > 0) {
                    deleteSubtree(sessionId);
                }
                return std::nullopt;
            }

            if (depth == 0) {
                requested = row;
            }
            cursor = row->parentId;
        }
        return requested;
    }

    std::vector<domain::Session> children(const std::string& parentId) override {
        std::vector<domain::Session> result;
        for (const auto& child : store_->findByParentId(parentId)) {
            if (auto live = get(child.sessionId)) {
                result.push_back(*live);
            }
        }
        return result;
    }

    ports::input::SessionResult createDelegated(
        const domain::Session& parent,
        const std::string& scope,
        const std::string& identityToken,
        std::chrono::seconds duration
    ) override {
        if (duration.count() <= 0) {
            return fail(domain::SessionError::INVALID_INPUT, "Session duration must be positive");
        }

        // Код у делегированной сессии не используется: сразу просрочен
        domain::Session child = newSession(scope, duration, std::chrono::seconds(0));
        child.validated = true;
        child.parentId = parent.sessionId;
        child.identityToken = identityToken;
        child.identityKey = parent.identityKey;
        if (!issue(child, std::nullopt)) {
            return notFound();
        }

        std::cout << "[SessionLifecycleManager] Created delegated session " << shortId(child.sessionId)
                  << " under " << shortId(parent.sessionId) << std::endl;
        return ports::input::SessionResult::ok(child);
    }

    bool deleteSession(const std::string& sessionId) override {
        auto deleted = deleteSubtree(sessionId);
        return std::find(deleted.begin(), deleted.end(), sessionId) != deleted.end();
    }

    std::size_t deleteByIdentity(const std::string& identity) override {
        std::string identityKey = codec_->sealDeterministic(identity, IDENTITY_LOOKUP_KEY);

        std::size_t total = 0;
        for (const auto& session : store_->findByIdentity(identityKey)) {
            total += deleteSubtree(session.sessionId).size();
        }
        std::cout << "[SessionLifecycleManager] Revoked " << total << " sessions of an identity" << std::endl;
        return total;
    }

    std::size_t deleteExpired(std::chrono::system_clock::time_point threshold) override {
        std::size_t deleted = store_->deleteExpired(threshold);
        std::cout << "[SessionLifecycleManager] Deleted " << deleted << " expired sessions" << std::endl;
        return deleted;
    }

    bool checkAccess(const std::string& sessionId, const std::string& callerScope) override {
        auto session = get(sessionId);
        return session && session->scope == callerScope;
    }

private:
    std::shared_ptr<settings::SessionSettings> settings_;
    std::shared_ptr<ports::output::ISessionStore> store_;
    std::shared_ptr<ports::output::IIdentityTokenCodec> codec_;
    std::shared_ptr<ports::output::IRandomSource> random_;
    std::shared_ptr<ports::output::IClock> clock_;

    static ports::input::SessionResult fail(domain::SessionError error, const std::string& message) {
        return ports::input::SessionResult::fail(error, message);
    }

    static ports::input::SessionResult notFound() {
        return fail(domain::SessionError::NOT_FOUND, "Session not found");
    }

    domain::Session newSession(
        const std::string& scope,
        std::chrono::seconds duration,
        std::chrono::seconds codeValidity
    ) {
        auto now = clock_->now();

        domain::Session session;
        session.code = generateCode();
        session.codeExpiresAt = now + codeValidity;
        session.expiresAt = now + duration;
        session.duration = duration;
        session.validated = false;
        session.createdAt = now;
        session.scope = scope;
        return session;
    }

    /**
     * @brief Преемник при ротации: validated, duration и parentId копируются
     */
    domain::Session successorOf(const domain::Session& old, const std::string& scope) {
        domain::Session next = newSession(scope, old.duration, settings_->getCodeValidity());
        next.validated = old.validated;
        next.parentId = old.parentId;
        return next;
    }

    /**
     * @brief Присвоить идентификатор и сохранить (вставка или замена supersedes)
     *
     * Предпроверка exists() отсекает большинство коллизий, окончательно
     * уникальность гарантирует ограничение хранилища.
     * @return false, если заменяемой сессии supersedes уже нет
     * @throws domain::StorageException если свободный идентификатор не найден
     */
    bool issue(domain::Session& session, const std::optional<std::string>& supersedes) {
        using ports::output::ReplaceOutcome;

        for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
            session.sessionId = generateSessionId();
            if (store_->exists(session.sessionId)) {
                std::cerr << "[SessionLifecycleManager] Session id collision, regenerating" << std::endl;
                continue;
            }

            if (!supersedes) {
                if (store_->insert(session)) {
                    return true;
                }
            } else {
                switch (store_->replace(*supersedes, session)) {
                    case ReplaceOutcome::REPLACED:
                        return true;
                    case ReplaceOutcome::ORIGINAL_MISSING:
                        std::cerr << "[SessionLifecycleManager] Session " << shortId(*supersedes)
                                  << " vanished before replacement" << std::endl;
                        return false;
                    case ReplaceOutcome::ID_CONFLICT:
                        break;
                }
            }
            std::cerr << "[SessionLifecycleManager] Session id taken concurrently, regenerating" << std::endl;
        }
        throw domain::StorageException("Unable to allocate a unique session id after " +
                                       std::to_string(MAX_ID_ATTEMPTS) + " attempts");
    }

    ports::input::SessionResult extend(domain::Session& session, std::chrono::seconds duration) {
        session.expiresAt = clock_->now() + duration;
        if (!store_->update(session)) {
            return notFound();
        }
        return ports::input::SessionResult::ok(session);
    }

    /**
     * @brief Удалить сессию и всех потомков одной операцией хранилища
     *
     * Обход в ширину с защитой от циклов; порядок удаления —
     * от самых глубоких потомков к корню.
     */
    std::vector<std::string> deleteSubtree(const std::string& rootId) {
        std::vector<std::string> order{rootId};
        std::unordered_set<std::string> visited{rootId};

        for (std::size_t i = 0; i < order.size(); ++i) {
            for (const auto& child : store_->findByParentId(order[i])) {
                if (visited.insert(child.sessionId).second) {
                    order.push_back(child.sessionId);
                }
            }
        }
        std::reverse(order.begin(), order.end());

        auto deleted = store_->deleteMany(order);
        if (deleted.size() > 1) {
            std::cout << "[SessionLifecycleManager] Cascade removed " << deleted.size()
                      << " sessions under " << shortId(rootId) << std::endl;
        }
        return deleted;
    }

    std::string generateSessionId() {
        static const char* alphabet = "abcdefghijklmnopqrstuvwxyz234567";
        auto bytes = random_->randomBytes(SESSION_ID_LENGTH);

        std::string id;
        id.reserve(SESSION_ID_LENGTH);
        for (uint8_t b : bytes) {
            id.push_back(alphabet[b % 32]);
        }
        return id;
    }

    /**
     * @brief 6-значный код без смещения распределения (rejection sampling)
     */
    std::string generateCode() {
        constexpr uint64_t space = 0x100000000ULL;
        constexpr uint64_t limit = space - (space % CODE_RANGE);

        uint64_t value = 0;
        do {
            auto bytes = random_->randomBytes(4);
            value = (static_cast<uint64_t>(bytes[0]) << 24) |
                    (static_cast<uint64_t>(bytes[1]) << 16) |
                    (static_cast<uint64_t>(bytes[2]) << 8) |
                    static_cast<uint64_t>(bytes[3]);
        } while (value >= limit);

        std::ostringstream ss;
        ss << std::setw(6) << std::setfill('0') << (value % CODE_RANGE);
        return ss.str();
    }

    static bool constantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) {
            return false;
        }
        unsigned char diff = 0;
        for (std::size_t i = 0; i < a.size(); ++i) {
            diff |= static_cast<unsigned char>(a[i] ^ b[i]);
        }
        return diff == 0;
    }

    static std::string shortId(const std::string& sessionId) {
        return sessionId.substr(0, 6) + "...";
    }
};

} // namespace sessions::application
