#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/SessionContextResolver.hpp"
#include "adapters/primary/SessionCookies.hpp"
#include "ports/input/ISessionGuard.hpp"
#include "settings/BridgeSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bridge::adapters::primary {

/**
 * @brief Middleware: проверка сессии guard'ом и передача пользователя дальше по цепочке
 *
 * ALLOW    → атрибуты principalId / tenantId / sessionId, статус 0 (chain продолжится)
 * REDIRECT → 302 на страницу логина
 * REJECT   → {"error": "..."} со статусом по AuthError
 *
 * tenantHintFromPath: tenantId маршрута берётся из первого wildcard пути
 * (только для /auth/init-session/*).
 */
class SessionGuardMiddleware : public IHttpHandler {
public:
    SessionGuardMiddleware(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<SessionContextResolver> resolver,
        std::shared_ptr<ports::input::ISessionGuard> guard,
        bool tenantHintFromPath = false
    ) : settings_(std::move(settings))
      , resolver_(std::move(resolver))
      , guard_(std::move(guard))
      , tenantHintFromPath_(tenantHintFromPath)
    {}

    void handle(IRequest& req, IResponse& res) override {
        domain::SessionContext ctx;
        try {
            ctx = resolver_->resolve(req);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[SessionGuardMiddleware] Session lookup failed: " << e.what() << std::endl;
            sendError(res, 500, "Session store unavailable");
            return;
        }

        if (tenantHintFromPath_) {
            ctx.routeTenantId = req.getPathParam(0);
        }

        auto result = guard_->authorize(ctx);

        if (!result.allowed()) {
            std::cerr << "[SessionGuardMiddleware] " << domain::toString(result.outcome)
                      << " " << domain::toString(result.error)
                      << " (" << req.getPath() << ", host: " << ctx.host << ")" << std::endl;
        }

        switch (result.outcome) {
            case domain::GuardOutcome::ALLOW:
                req.setAttribute("principalId", result.principal->principalId);
                req.setAttribute("tenantId", result.principal->tenantId);
                if (result.context.session) {
                    req.setAttribute("sessionId", result.context.session->sessionId);
                }
                res.setStatus(0); // для middleware
                return;

            case domain::GuardOutcome::REDIRECT:
                res.setStatus(302);
                res.setHeader("Location", result.redirectUrl);
                return;

            case domain::GuardOutcome::REJECT:
                // Уничтоженная по простою сессия: cookie тоже стираем
                if (result.error == domain::AuthError::SESSION_EXPIRED && ctx.scope) {
                    res.setHeader("Set-Cookie", SessionCookies::clear(*ctx.scope, settings_->isCookieSecure()));
                }
                sendError(res, domain::httpStatusFor(result.error), result.message);
                return;
        }
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<SessionContextResolver> resolver_;
    std::shared_ptr<ports::input::ISessionGuard> guard_;
    bool tenantHintFromPath_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace bridge::adapters::primary
