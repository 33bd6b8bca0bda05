#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/primary/SessionContextResolver.hpp"
#include "adapters/primary/SessionCookies.hpp"
#include "settings/BridgeSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bridge::adapters::primary {

/**
 * @brief Выход: уничтожает сессию того scope, на который пришёл запрос
 *
 * POST /api/auth/logout → {"message": "Logout successful", "tenantId": "acme" | null}
 */
class LogoutHandler : public IHttpHandler {
public:
    LogoutHandler(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<SessionContextResolver> resolver
    ) : settings_(std::move(settings))
      , authService_(std::move(authService))
      , resolver_(std::move(resolver))
    {}

    void handle(IRequest& req, IResponse& res) override {
        domain::SessionContext ctx;
        try {
            ctx = resolver_->resolve(req);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[LogoutHandler] Session lookup failed: " << e.what() << std::endl;
            sendFailure(res);
            return;
        }

        auto result = authService_->logout(ctx);
        if (!result.success) {
            sendFailure(res);
            return;
        }

        nlohmann::json response;
        response["message"] = result.message;
        if (result.tenantId) {
            response["tenantId"] = *result.tenantId;
        } else {
            response["tenantId"] = nullptr;
        }

        if (ctx.scope) {
            res.setHeader("Set-Cookie", SessionCookies::clear(*ctx.scope, settings_->isCookieSecure()));
        }
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<SessionContextResolver> resolver_;

    void sendFailure(IResponse& res) {
        nlohmann::json error;
        error["message"] = "Logout failed";
        res.setResult(500, "application/json", error.dump());
    }
};

} // namespace bridge::adapters::primary
