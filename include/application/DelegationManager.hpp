#pragma once

#include "ports/input/IDelegationManager.hpp"
#include "ports/input/ISessionLifecycleManager.hpp"
#include "ports/output/IIdentityTokenCodec.hpp"
#include "ports/output/IScopeRegistry.hpp"
#include "settings/SessionSettings.hpp"
#include <memory>
#include <iostream>

namespace sessions::application {

/**
 * @brief Делегирование подтверждённой сессии другому scope
 *
 * Ребёнок всегда получает собственный шифротекст идентичности,
 * родитель после делегирования ротируется (тоже с новым шифротекстом).
 */
class DelegationManager : public ports::input::IDelegationManager {
public:
    DelegationManager(
        std::shared_ptr<settings::SessionSettings> settings,
        std::shared_ptr<ports::input::ISessionLifecycleManager> lifecycle,
        std::shared_ptr<ports::output::IIdentityTokenCodec> codec,
        std::shared_ptr<ports::output::IScopeRegistry> scopes
    ) : settings_(std::move(settings))
      , lifecycle_(std::move(lifecycle))
      , codec_(std::move(codec))
      , scopes_(std::move(scopes))
    {
        std::cout << "[DelegationManager] Created" << std::endl;
    }

    ports::input::DelegationResult delegate(
        const std::string& parentId,
        const std::string& targetScope
    ) override {
        using domain::SessionError;
        using ports::input::DelegationResult;

        auto parent = lifecycle_->get(parentId);
        if (!parent) {
            return DelegationResult::fail(SessionError::INVALID_PARENT, "Parent session not found");
        }
        if (!parent->validated) {
            return DelegationResult::fail(SessionError::INVALID_PARENT, "Parent session is not validated");
        }
        if (parent->isDelegated()) {
            return DelegationResult::fail(SessionError::INVALID_PARENT, "Delegated session cannot delegate");
        }
        if (targetScope == parent->scope) {
            return DelegationResult::fail(SessionError::INVALID_INPUT, "Cannot delegate to the same scope");
        }
        if (!scopes_->isKnownScope(targetScope)) {
            return DelegationResult::fail(SessionError::INVALID_SCOPE, "Unknown target scope");
        }

        // Не больше одного ребёнка на (parent, scope)
        for (const auto& child : lifecycle_->children(parent->sessionId)) {
            if (child.scope == targetScope) {
                lifecycle_->deleteSession(child.sessionId);
            }
        }

        if (!parent->identityToken) {
            return DelegationResult::fail(SessionError::INVALID_IDENTITY, "Parent session has no identity");
        }
        auto identity = codec_->open(*parent->identityToken);
        if (!identity) {
            std::cerr << "[DelegationManager] Parent identity token does not authenticate" << std::endl;
            return DelegationResult::fail(SessionError::INVALID_IDENTITY, "Identity token does not authenticate");
        }
        std::string childToken = codec_->seal(*identity);

        auto created = lifecycle_->createDelegated(
            *parent, targetScope, childToken, settings_->getDelegatedLifetime());
        if (!created.success) {
            return DelegationResult::fail(created.error, created.message);
        }

        auto refreshed = lifecycle_->refresh(parent->sessionId);
        if (!refreshed.success) {
            return DelegationResult::fail(refreshed.error, refreshed.message);
        }

        DelegationResult result;
        result.success = true;
        result.child = created.session;
        result.child.parentId = refreshed.session.sessionId;
        result.parent = refreshed.session;

        std::cout << "[DelegationManager] Delegated " << scopeName(parent->scope)
                  << " -> " << scopeName(targetScope) << std::endl;
        return result;
    }

private:
    std::shared_ptr<settings::SessionSettings> settings_;
    std::shared_ptr<ports::input::ISessionLifecycleManager> lifecycle_;
    std::shared_ptr<ports::output::IIdentityTokenCodec> codec_;
    std::shared_ptr<ports::output::IScopeRegistry> scopes_;

    std::string scopeName(const std::string& scope) const {
        return scopes_->getScopeName(scope).value_or("unknown scope");
    }
};

} // namespace sessions::application
