#pragma once

#include "ports/output/ISessionStore.hpp"
#include "settings/DbSettings.hpp"
#include "domain/StorageException.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace sessions::adapters::secondary {

/**
 * @brief Хранилище сессий в PostgreSQL (схема: migrations/001_create_sessions.sql)
 *
 * Время хранится как TIMESTAMPTZ, передаётся в микросекундах от эпохи.
 * Любая ошибка БД логируется и пробрасывается как domain::StorageException;
 * конфликт первичного ключа в insert возвращает false, в replace — ID_CONFLICT.
 */
class PostgresSessionStore : public ports::output::ISessionStore {
public:
    explicit PostgresSessionStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresSessionStore] Connecting to " << settings_->getHost() << ":"
                  << settings_->getPort() << "/" << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresSessionStore] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresSessionStore] Connection failed: " << e.what() << std::endl;
            throw domain::StorageException(std::string("Connection failed: ") + e.what());
        }
    }

    ~PostgresSessionStore() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    bool insert(const domain::Session& session) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            insertRow(txn, session);
            txn.commit();
            return true;

        } catch (const pqxx::unique_violation& e) {
            if (isIdConflict(e)) return false;
            throw storageError("insert", e);
        } catch (const std::exception& e) {
            throw storageError("insert", e);
        }
    }

    ports::output::ReplaceOutcome replace(
        const std::string& oldId,
        const domain::Session& replacement
    ) override {
        using ports::output::ReplaceOutcome;
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // Блокировка заменяемой строки: параллельная ротация того же
            // идентификатора ждёт коммита и затем видит строку удалённой
            auto original = txn.exec_params(
                "SELECT 1 FROM sessions WHERE session_id = $1 FOR UPDATE",
                oldId
            );
            if (original.empty()) {
                txn.abort();
                return ReplaceOutcome::ORIGINAL_MISSING;
            }

            insertRow(txn, replacement);
            txn.exec_params(
                "UPDATE sessions SET parent_id = $1 WHERE parent_id = $2",
                replacement.sessionId,
                oldId
            );
            auto removed = txn.exec_params("DELETE FROM sessions WHERE session_id = $1", oldId);
            if (removed.affected_rows() != 1) {
                txn.abort();
                return ReplaceOutcome::ORIGINAL_MISSING;
            }

            // uq_sessions_child_scope отложено до коммита
            txn.commit();
            return ReplaceOutcome::REPLACED;

        } catch (const pqxx::unique_violation& e) {
            if (isIdConflict(e)) return ReplaceOutcome::ID_CONFLICT;
            throw storageError("replace", e);
        } catch (const std::exception& e) {
            throw storageError("replace", e);
        }
    }

    std::optional<domain::Session> findById(const std::string& sessionId) override {
        auto sessions = select("findById", "WHERE session_id = $1", sessionId);
        if (sessions.empty()) return std::nullopt;
        return sessions.front();
    }

    std::vector<domain::Session> findByParentId(const std::string& parentId) override {
        return select("findByParentId", "WHERE parent_id = $1", parentId);
    }

    std::vector<domain::Session> findByIdentity(
        const std::string& identityKey,
        const std::string& scope
    ) override {
        return select("findByIdentity", "WHERE identity_key = $1 AND scope = $2", identityKey, scope);
    }

    std::vector<domain::Session> findByIdentity(const std::string& identityKey) override {
        return select("findByIdentity", "WHERE identity_key = $1", identityKey);
    }

    std::vector<domain::Session> findAllWithIdentity() override {
        return select("findAllWithIdentity", "WHERE identity_token IS NOT NULL");
    }

    bool exists(const std::string& sessionId) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT 1 FROM sessions WHERE session_id = $1",
                sessionId
            );
            txn.commit();
            return !result.empty();

        } catch (const std::exception& e) {
            throw storageError("exists", e);
        }
    }

    bool update(const domain::Session& session) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    UPDATE sessions SET
                        identity_token = $2,
                        identity_key = $3,
                        code = $4,
                        code_expires_at = to_timestamp($5::double precision / 1000000),
                        expires_at = to_timestamp($6::double precision / 1000000),
                        duration_seconds = $7,
                        validated = $8,
                        scope = $9,
                        parent_id = $10
                    WHERE session_id = $1
                )",
                session.sessionId,
                session.identityToken,
                session.identityKey,
                session.code,
                toMicros(session.codeExpiresAt),
                toMicros(session.expiresAt),
                static_cast<int64_t>(session.duration.count()),
                session.validated,
                session.scope,
                session.parentId
            );

            txn.commit();
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            throw storageError("update", e);
        }
    }

    std::vector<std::string> deleteMany(const std::vector<std::string>& sessionIds) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            std::vector<std::string> deleted;
            for (const auto& id : sessionIds) {
                auto result = txn.exec_params(
                    "DELETE FROM sessions WHERE session_id = $1",
                    id
                );
                if (result.affected_rows() > 0) {
                    deleted.push_back(id);
                }
            }

            txn.commit();
            return deleted;

        } catch (const std::exception& e) {
            throw storageError("deleteMany", e);
        }
    }

    std::size_t deleteExpired(std::chrono::system_clock::time_point threshold) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "DELETE FROM sessions WHERE expires_at < to_timestamp($1::double precision / 1000000)",
                toMicros(threshold)
            );
            txn.commit();
            return static_cast<std::size_t>(result.affected_rows());

        } catch (const std::exception& e) {
            throw storageError("deleteExpired", e);
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    static constexpr const char* SELECT_COLUMNS = R"(
        SELECT session_id, identity_token, identity_key, code,
               (EXTRACT(EPOCH FROM code_expires_at) * 1000000)::bigint AS code_exp_us,
               (EXTRACT(EPOCH FROM expires_at) * 1000000)::bigint AS exp_us,
               duration_seconds, validated,
               (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint AS created_us,
               scope, parent_id
        FROM sessions
    )";

    template <typename... Args>
    std::vector<domain::Session> select(const char* operation, const std::string& where, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                std::string(SELECT_COLUMNS) + where,
                std::forward<Args>(args)...
            );
            txn.commit();

            std::vector<domain::Session> sessions;
            for (const auto& row : result) {
                sessions.push_back(rowToSession(row));
            }
            return sessions;

        } catch (const std::exception& e) {
            throw storageError(operation, e);
        }
    }

    static void insertRow(pqxx::work& txn, const domain::Session& session) {
        txn.exec_params(
            R"(
                INSERT INTO sessions (session_id, identity_token, identity_key, code,
                                      code_expires_at, expires_at, duration_seconds,
                                      validated, created_at, scope, parent_id)
                VALUES ($1, $2, $3, $4,
                        to_timestamp($5::double precision / 1000000),
                        to_timestamp($6::double precision / 1000000),
                        $7, $8,
                        to_timestamp($9::double precision / 1000000),
                        $10, $11)
            )",
            session.sessionId,
            session.identityToken,
            session.identityKey,
            session.code,
            toMicros(session.codeExpiresAt),
            toMicros(session.expiresAt),
            static_cast<int64_t>(session.duration.count()),
            session.validated,
            toMicros(session.createdAt),
            session.scope,
            session.parentId
        );
    }

    static bool isIdConflict(const pqxx::unique_violation& e) {
        return std::string(e.what()).find("sessions_pkey") != std::string::npos;
    }

    static domain::StorageException storageError(const char* operation, const std::exception& e) {
        std::cerr << "[PostgresSessionStore] " << operation << "() failed: " << e.what() << std::endl;
        return domain::StorageException(std::string(operation) + " failed: " + e.what());
    }

    static int64_t toMicros(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    }

    static std::chrono::system_clock::time_point fromMicros(int64_t micros) {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros)));
    }

    static std::optional<std::string> optionalText(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return field.as<std::string>();
    }

    domain::Session rowToSession(const pqxx::row& row) const {
        domain::Session session;
        session.sessionId = row["session_id"].as<std::string>();
        session.identityToken = optionalText(row["identity_token"]);
        session.identityKey = optionalText(row["identity_key"]);
        session.code = row["code"].as<std::string>();
        session.codeExpiresAt = fromMicros(row["code_exp_us"].as<int64_t>());
        session.expiresAt = fromMicros(row["exp_us"].as<int64_t>());
        session.duration = std::chrono::seconds(row["duration_seconds"].as<int64_t>());
        session.validated = row["validated"].as<bool>();
        session.createdAt = fromMicros(row["created_us"].as<int64_t>());
        session.scope = row["scope"].as<std::string>();
        session.parentId = optionalText(row["parent_id"]);
        return session;
    }
};

} // namespace sessions::adapters::secondary
