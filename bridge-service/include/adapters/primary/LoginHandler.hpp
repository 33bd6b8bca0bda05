#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/primary/SessionContextResolver.hpp"
#include "adapters/primary/SessionCookies.hpp"
#include "settings/BridgeSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace bridge::adapters::primary {

/**
 * @brief Логин на домене логина
 *
 * POST /api/auth/login
 * {
 *   "email": "john@example.com",
 *   "password": "password123"
 * }
 *
 * Response (+ Set-Cookie: login.sid=...):
 * {
 *   "user": {"id": "1", "email": "...", "name": "...", "tenants": ["acme"]}
 * }
 */
class LoginHandler : public IHttpHandler {
public:
    LoginHandler(
        std::shared_ptr<settings::BridgeSettings> settings,
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<SessionContextResolver> resolver
    ) : settings_(std::move(settings))
      , authService_(std::move(authService))
      , resolver_(std::move(resolver))
    {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string email = body.value("email", "");
            std::string password = body.value("password", body.value("secret", ""));

            if (email.empty() || password.empty()) {
                sendError(res, 400, "email and password are required");
                return;
            }

            auto ctx = resolver_->resolve(req);
            if (!ctx.scope) {
                sendError(res, 400, "Unknown host");
                return;
            }

            std::cout << "[LoginHandler] Login attempt for email: " << email
                      << " (host: " << ctx.host << ")" << std::endl;

            auto result = authService_->login(ctx, email, password);
            if (!result.success) {
                sendError(res, domain::httpStatusFor(result.error), result.message);
                return;
            }

            nlohmann::json user;
            user["id"] = result.principal.id;
            user["email"] = result.principal.email;
            user["name"] = result.principal.name;
            user["tenants"] = result.principal.tenants;

            nlohmann::json response;
            response["user"] = user;

            res.setHeader("Set-Cookie", SessionCookies::issue(
                result.session->scope, result.session->sessionId,
                settings_->getSessionMaxAge(), settings_->isCookieSecure()));
            res.setResult(200, "application/json", response.dump());

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[LoginHandler] Session lookup failed: " << e.what() << std::endl;
            sendError(res, 500, "Session store unavailable");
        } catch (const std::exception& e) {
            std::cerr << "[LoginHandler] Login failed: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<settings::BridgeSettings> settings_;
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<SessionContextResolver> resolver_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace bridge::adapters::primary
