#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/primary/SessionContextResolver.hpp"
#include "adapters/primary/SessionCookies.hpp"
#include "settings/BridgeSettings.hpp"
#include <memory>
#include <iostream>
#include <stdexcept>

namespace bridge::adapters::primary {

/**
 * @brief Погашение токена передачи на домене тенанта
 *
 * GET /verify/{token}
 * GET /api/tenant/verify-token/{token}
 *
 * Успех: Set-Cookie сессии тенанта + HTML, уводящий браузер на корень тенанта.
 * Ошибка: 401 "Authentication failed" (text/plain).
 */
class VerifyTokenHandler : public IHttpHandler {
public:
    VerifyTokenHandler(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<SessionContextResolver> resolver
    ) : settings_(std::move(settings))
      , authService_(std::move(authService))
      , resolver_(std::move(resolver))
    {}

    void handle(IRequest& req, IResponse& res) override {
        std::string token = req.getPathParam(0).value_or("");
        if (token.empty()) {
            sendFailure(res);
            return;
        }

        ports::input::RedeemResult result;
        try {
            auto ctx = resolver_->resolve(req);
            result = authService_->redeemHandoff(ctx, token);
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[VerifyTokenHandler] Session lookup failed: " << e.what() << std::endl;
            sendFailure(res);
            return;
        } catch (const std::exception& e) {
            std::cerr << "[VerifyTokenHandler] Token verification error: " << e.what() << std::endl;
            res.setResult(500, "text/plain", "Internal server error");
            return;
        }

        if (!result.success) {
            std::cerr << "[VerifyTokenHandler] Token verification failed: " << result.message << std::endl;
            sendFailure(res);
            return;
        }

        res.setHeader("Set-Cookie", SessionCookies::issue(
            result.session->scope, result.session->sessionId,
            settings_->getSessionMaxAge(), settings_->isCookieSecure()));
        res.setResult(200, "text/html", redirectPage());
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<SessionContextResolver> resolver_;

    static void sendFailure(IResponse& res) {
        res.setResult(401, "text/plain", "Authentication failed");
    }

    static std::string redirectPage() {
        return R"(<!DOCTYPE html>
<html>
<head>
  <title>Authentication Successful</title>
  <script>window.location.href = window.location.origin + '/';</script>
</head>
<body>
  <h1>Authentication successful</h1>
  <p>Redirecting to dashboard...</p>
</body>
</html>
)";
    }
};

} // namespace bridge::adapters::primary
