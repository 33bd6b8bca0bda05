#pragma once

#include "ports/input/ISessionGuard.hpp"
#include "application/DomainRouter.hpp"
#include "settings/BridgeSettings.hpp"
#include <memory>
#include <iostream>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace bridge::application {

/**
 * @brief Guard домена логина
 *
 * Состояния: Unauthenticated → Authenticated.
 * Неаутентифицированный запрос на init-session с tenantId получает
 * редирект на страницу логина с подсказкой тенанта, остальные - 401.
 * Таймаут простоя здесь не проверяется: время жизни сессии логина
 * определяется только max-age cookie.
 */
class LoginSessionGuard : public ports::input::ISessionGuard {
public:
    LoginSessionGuard(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<DomainRouter> domainRouter
    ) : settings_(std::move(settings))
      , domainRouter_(std::move(domainRouter))
    {}

    ports::input::GuardResult authorize(const domain::SessionContext& ctx) override {
        if (!ctx.session) {
            std::cerr << "[LoginSessionGuard] No session object found (host: " << ctx.host << ")" << std::endl;
            return redirectOrReject(ctx, domain::AuthError::NO_SESSION);
        }

        const auto* login = ctx.session->login();
        if (!login) {
            std::cerr << "[LoginSessionGuard] No user in session (host: " << ctx.host << ")" << std::endl;
            return redirectOrReject(ctx, domain::AuthError::NOT_AUTHENTICATED);
        }

        if (!domainRouter_->isLoginDomainHost(ctx.host)) {
            std::cerr << "[LoginSessionGuard] Unauthorized request for (host: " << ctx.host << ")" << std::endl;
            return reject(ctx, domain::AuthError::INVALID_HOST, "Unauthorized - Invalid host");
        }

        // Снимок пользователя берётся из самой сессии, бизнес-поля не меняются
        ports::input::GuardResult result;
        result.outcome = domain::GuardOutcome::ALLOW;
        result.context = ctx;
        result.principal = domain::AuthorizedPrincipal{login->principalId, ""};

        std::cout << "[LoginSessionGuard] Authorized request for (host: " << ctx.host << ")" << std::endl;
        return result;
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<DomainRouter> domainRouter_;

    ports::input::GuardResult redirectOrReject(const domain::SessionContext& ctx, domain::AuthError error) {
        if (ctx.routeTenantId && !ctx.routeTenantId->empty()) {
            ports::input::GuardResult result;
            result.outcome = domain::GuardOutcome::REDIRECT;
            result.error = error;
            result.message = "Please log in";
            result.redirectUrl = settings_->getLoginUrl() + "?tenantId=" + urlEncode(*ctx.routeTenantId);
            result.context = ctx;

            std::cout << "[LoginSessionGuard] Redirecting to login page for tenant: "
                      << *ctx.routeTenantId << std::endl;
            return result;
        }
        return reject(ctx, error, "Unauthorized - Please log in");
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

    static std::string urlEncode(const std::string& value) {
        std::ostringstream out;
        out << std::hex << std::uppercase << std::setfill('0');
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out << c;
            } else {
                out << '%' << std::setw(2) << static_cast<int>(c);
            }
        }
        return out.str();
    }
};

} // namespace bridge::application
