#pragma once

#include "ports/input/ISessionGuard.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/IClock.hpp"
#include "application/DomainRouter.hpp"
#include "settings/BridgeSettings.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <functional>
#include <iostream>

namespace bridge::application {

/**
 * @brief Guard доменов тенантов
 *
 * Состояния: Unauthenticated, IdleExpired, Authenticated.
 *
 * Проверка простоя и последующее уничтожение/обновление сессии
 * выполняются под полосатой блокировкой (по хешу sessionId),
 * сессия перечитывается из репозитория внутри блокировки.
 */
class TenantSessionGuard : public ports::input::ISessionGuard {
public:
    static constexpr size_t LOCK_STRIPES = 16;

    TenantSessionGuard(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<DomainRouter> domainRouter
    ) : settings_(std::move(settings))
      , sessionRepo_(std::move(sessionRepo))
      , clock_(std::move(clock))
      , domainRouter_(std::move(domainRouter))
    {}

    ports::input::GuardResult authorize(const domain::SessionContext& ctx) override {
        if (!ctx.session) {
            std::cerr << "[TenantSessionGuard] No session found (host: " << ctx.host << ")" << std::endl;
            return reject(ctx, domain::AuthError::NO_SESSION, "No session found");
        }
        if (!ctx.session->isBound()) {
            std::cerr << "[TenantSessionGuard] User not authenticated (host: " << ctx.host << ")" << std::endl;
            return reject(ctx, domain::AuthError::NOT_AUTHENTICATED, "User not authenticated");
        }

        const auto& scope = ctx.session->scope;
        const auto& sessionId = ctx.session->sessionId;

        std::lock_guard<std::mutex> lock(stripeFor(scope, sessionId));

        auto now = clock_->now();
        std::optional<domain::Session> current;
        try {
            current = sessionRepo_->findById(scope, sessionId);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[TenantSessionGuard] Session lookup failed: " << e.what() << std::endl;
            return reject(ctx, domain::AuthError::SESSION_PERSISTENCE_FAILED, "Session store unavailable");
        }

        // Сессию уничтожил параллельный запрос
        if (!current || !current->isBound()) {
            std::cerr << "[TenantSessionGuard] Session no longer exists (host: " << ctx.host << ")" << std::endl;
            auto gone = ctx;
            gone.session.reset();
            return reject(gone, domain::AuthError::NO_SESSION, "No session found");
        }

        auto lastActivity = current->lastActivity().value_or(now);
        if (now - lastActivity > settings_->getTenantIdleTimeout()) {
            return expire(ctx, *current);
        }

        current->touch(now);
        bool stillExists = false;
        try {
            stillExists = sessionRepo_->update(*current);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[TenantSessionGuard] Failed to refresh session: " << e.what() << std::endl;
            return reject(ctx, domain::AuthError::SESSION_PERSISTENCE_FAILED, "Failed to refresh session");
        }

        // logout/redeem удалили сессию между чтением и записью
        if (!stillExists) {
            std::cerr << "[TenantSessionGuard] Session destroyed during refresh (host: " << ctx.host << ")" << std::endl;
            auto gone = ctx;
            gone.session.reset();
            return reject(gone, domain::AuthError::NO_SESSION, "No session found");
        }

        auto refreshed = ctx;
        refreshed.session = *current;

        // Общие маршруты на хосте логина: пользователь без тенанта
        if (domainRouter_->isLoginHost(ctx.host)) {
            return allow(refreshed, domain::AuthorizedPrincipal{current->principalId(), ""});
        }

        const auto* tenant = current->tenant();
        std::string tenantId = tenant ? tenant->tenantId : "";
        if (tenantId.empty()) {
            std::cerr << "[TenantSessionGuard] No tenant specified (host: " << ctx.host << ")" << std::endl;
            return reject(refreshed, domain::AuthError::TENANT_MISMATCH, "No tenant specified");
        }
        if (!domainRouter_->hostMatchesTenant(ctx.host, tenantId)) {
            std::cerr << "[TenantSessionGuard] Invalid tenant access: " << ctx.host
                      << " vs " << tenantId << std::endl;
            return reject(refreshed, domain::AuthError::TENANT_MISMATCH, "Invalid tenant access");
        }

        return allow(refreshed, domain::AuthorizedPrincipal{current->principalId(), tenantId});
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<DomainRouter> domainRouter_;
    std::array<std::mutex, LOCK_STRIPES> stripes_;

    std::mutex& stripeFor(const domain::CookieScope& scope, const std::string& sessionId) {
        size_t h = std::hash<std::string>{}(scope.cookieName + "|" + sessionId);
        return stripes_[h % LOCK_STRIPES];
    }

    /**
     * @brief IdleExpired: сессия уничтожается до ответа
     */
    ports::input::GuardResult expire(const domain::SessionContext& ctx, const domain::Session& session) {
        try {
            sessionRepo_->deleteById(session.scope, session.sessionId);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[TenantSessionGuard] Failed to destroy idle session: " << e.what() << std::endl;
            return reject(ctx, domain::AuthError::SESSION_PERSISTENCE_FAILED, "Failed to destroy session");
        }

        std::cout << "[TenantSessionGuard] Session expired due to inactivity (host: "
                  << ctx.host << ", user: " << session.principalId() << ")" << std::endl;

        auto destroyed = ctx;
        destroyed.session.reset();
        return reject(destroyed, domain::AuthError::SESSION_EXPIRED, "Session expired due to inactivity");
    }

    static ports::input::GuardResult allow(
        const domain::SessionContext& ctx,
        const domain::AuthorizedPrincipal& principal
    ) {
        ports::input::GuardResult result;
        result.outcome = domain::GuardOutcome::ALLOW;
        result.principal = principal;
        result.context = ctx;
        return result;
    }

    static ports::input::GuardResult reject(
        const domain::SessionContext& ctx,
        domain::AuthError error,
        const std::string& message
    ) {
        ports::input::GuardResult result;
        result.outcome = domain::GuardOutcome::REJECT;
        result.error = error;
        result.message = message;
        result.context = ctx;
        return result;
    }
};

} // namespace bridge::application
