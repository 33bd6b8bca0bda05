#pragma once

#include "ports/input/IAuthService.hpp"
#include "ports/input/IHandoffTokenService.hpp"
#include "ports/output/IUserDirectory.hpp"
#include "ports/output/ISessionRepository.hpp"
#include "ports/output/ITokenGenerator.hpp"
#include "ports/output/IClock.hpp"
#include "application/DomainRouter.hpp"
#include "settings/BridgeSettings.hpp"
#include <memory>
#include <algorithm>
#include <iostream>

namespace bridge::application {

/**
 * @brief Auth Engine
 *
 * Единственный владелец создания/удаления сессий тенантов и токенов передачи.
 * Все записи в хранилище сессий синхронны: результат возвращается только
 * после фиксации, ошибка хранилища превращается в SESSION_PERSISTENCE_FAILED.
 */
class AuthService : public ports::input::IAuthService {
public:
    AuthService(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<ports::output::IUserDirectory> userDirectory,
        std::shared_ptr<ports::output::ISessionRepository> sessionRepo,
        std::shared_ptr<ports::input::IHandoffTokenService> tokenService,
        std::shared_ptr<ports::output::ITokenGenerator> tokenGenerator,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<DomainRouter> domainRouter
    ) : settings_(std::move(settings))
      , userDirectory_(std::move(userDirectory))
      , sessionRepo_(std::move(sessionRepo))
      , tokenService_(std::move(tokenService))
      , tokenGenerator_(std::move(tokenGenerator))
      , clock_(std::move(clock))
      , domainRouter_(std::move(domainRouter))
    {}

    ports::input::LoginResult login(
        const domain::SessionContext& ctx,
        const std::string& email,
        const std::string& secret
    ) override {
        ports::input::LoginResult result;

        if (!ctx.scope || !ctx.scope->isLogin()) {
            std::cerr << "[AuthService] Login attempted outside login domain (host: " << ctx.host << ")" << std::endl;
            result.error = domain::AuthError::INVALID_HOST;
            result.message = "Login is only available on the login domain";
            return result;
        }

        auto user = userDirectory_->findByEmail(email);
        if (!user || user->password != secret) {
            std::cerr << "[AuthService] Invalid credentials for " << email << std::endl;
            result.error = domain::AuthError::INVALID_CREDENTIALS;
            result.message = "Invalid credentials";
            return result;
        }

        auto now = clock_->now();
        domain::Session session(tokenGenerator_->generate(), *ctx.scope, now, settings_->getSessionMaxAge());
        session.binding = domain::LoginSession{
            user->userId, user->email, user->name, user->tenants, now
        };

        try {
            // Новый ID при каждом логине, прежняя сессия этого cookie удаляется
            if (ctx.session) {
                sessionRepo_->deleteById(ctx.session->scope, ctx.session->sessionId);
            }
            sessionRepo_->save(session);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[AuthService] Failed to save login session: " << e.what() << std::endl;
            result.error = domain::AuthError::SESSION_PERSISTENCE_FAILED;
            result.message = "Failed to save session";
            return result;
        }

        std::cout << "[AuthService] User " << user->userId << " logged in" << std::endl;

        result.success = true;
        result.principal = domain::Principal::fromUser(*user);
        result.session = session;
        result.message = "Login successful";
        return result;
    }

    ports::input::LogoutResult logout(const domain::SessionContext& ctx) override {
        ports::input::LogoutResult result;

        if (!ctx.session) {
            result.success = true;
            result.message = "Logout successful";
            return result;
        }

        if (const auto* tenant = ctx.session->tenant()) {
            result.tenantId = tenant->tenantId;
        }

        try {
            result.destroyed = sessionRepo_->deleteById(ctx.session->scope, ctx.session->sessionId);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[AuthService] Session destruction error: " << e.what() << std::endl;
            result.error = domain::AuthError::SESSION_PERSISTENCE_FAILED;
            result.message = "Logout failed";
            return result;
        }

        std::cout << "[AuthService] Logout (" << ctx.session->scope.cookieName
                  << ", destroyed=" << result.destroyed << ")" << std::endl;

        result.success = true;
        result.message = "Logout successful";
        return result;
    }

    ports::input::HandoffResult initiateHandoff(
        const domain::SessionContext& ctx,
        const std::string& tenantId
    ) override {
        ports::input::HandoffResult result;

        const domain::LoginSession* login = ctx.session ? ctx.session->login() : nullptr;
        if (!login) {
            result.error = domain::AuthError::NOT_AUTHENTICATED;
            result.message = "Unauthorized - Please log in";
            return result;
        }

        auto granted = std::find(login->tenants.begin(), login->tenants.end(), tenantId);
        if (tenantId.empty() || granted == login->tenants.end()) {
            std::cerr << "[AuthService] User " << login->principalId
                      << " has no access to tenant " << tenantId << std::endl;
            result.error = domain::AuthError::TENANT_NOT_GRANTED;
            result.message = "Access denied to this tenant";
            return result;
        }

        result.token = tokenService_->issue(login->principalId, tenantId);

        std::string port = ctx.port.empty() ? settings_->getDefaultPort() : ctx.port;
        std::string scheme = ctx.scheme.empty() ? settings_->getDefaultScheme() : ctx.scheme;
        result.redirectUrl = scheme + "://" + domainRouter_->tenantHost(tenantId) + ":" + port
                           + "/verify/" + result.token;

        std::cout << "[AuthService] Handoff initiated for user " << login->principalId
                  << " -> " << domainRouter_->tenantHost(tenantId) << std::endl;

        result.success = true;
        result.message = "Handoff initiated";
        return result;
    }

    ports::input::RedeemResult redeemHandoff(
        const domain::SessionContext& ctx,
        const std::string& token
    ) override {
        ports::input::RedeemResult result;

        // Без scope тенанта сессию создать негде, токен не трогаем
        if (!ctx.scope || !ctx.scope->isTenant()) {
            std::cerr << "[AuthService] Token presented outside tenant domain (host: " << ctx.host << ")" << std::endl;
            result.error = domain::AuthError::TENANT_MISMATCH;
            result.message = "Invalid tenant";
            return result;
        }

        auto redeemed = tokenService_->redeem(token, ctx.host);
        if (!redeemed.success) {
            result.error = redeemed.error;
            result.message = redeemed.message;
            return result;
        }

        // Членство в тенанте перепроверяется при погашении
        auto user = userDirectory_->findById(redeemed.principalId, redeemed.tenantId);
        if (!user) {
            std::cerr << "[AuthService] User " << redeemed.principalId
                      << " not found for tenant " << redeemed.tenantId << std::endl;
            result.error = domain::AuthError::TENANT_NOT_GRANTED;
            result.message = "User not found";
            return result;
        }

        auto now = clock_->now();
        domain::Session session(tokenGenerator_->generate(), *ctx.scope, now, settings_->getSessionMaxAge());
        session.binding = domain::TenantSession{
            user->userId, redeemed.tenantId, user->email, now
        };

        try {
            if (ctx.session) {
                sessionRepo_->deleteById(ctx.session->scope, ctx.session->sessionId);
            }
            sessionRepo_->save(session);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[AuthService] Failed to save tenant session: " << e.what() << std::endl;
            result.error = domain::AuthError::SESSION_PERSISTENCE_FAILED;
            result.message = "Failed to save session";
            return result;
        }

        std::cout << "[AuthService] Tenant session created for user " << user->userId
                  << " on " << ctx.host << std::endl;

        result.success = true;
        result.session = session;
        result.message = "Tenant session created";
        return result;
    }

    ports::input::ValidateResult validateSession(const domain::SessionContext& ctx) override {
        ports::input::ValidateResult result;
        if (!ctx.isAuthenticated()) {
            result.message = "No active session";
            return result;
        }
        result.valid = true;
        result.principalId = ctx.session->principalId();
        result.message = "Session is valid";
        return result;
    }

    std::optional<domain::Principal> currentPrincipal(const std::string& principalId) override {
        auto user = userDirectory_->findById(principalId);
        if (!user) {
            return std::nullopt;
        }
        return domain::Principal::fromUser(*user);
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<ports::output::IUserDirectory> userDirectory_;
    std::shared_ptr<ports::output::ISessionRepository> sessionRepo_;
    std::shared_ptr<ports::input::IHandoffTokenService> tokenService_;
    std::shared_ptr<ports::output::ITokenGenerator> tokenGenerator_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<DomainRouter> domainRouter_;
};

} // namespace bridge::application
