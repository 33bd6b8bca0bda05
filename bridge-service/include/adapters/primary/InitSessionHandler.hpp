#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/primary/SessionContextResolver.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>
#include <stdexcept>

namespace bridge::adapters::primary {

/**
 * @brief Переход с домена логина на домен тенанта
 *
 * GET /api/auth/init-session/{tenantId}
 * (за SessionGuardMiddleware домена логина)
 *
 * 302 Location: http://{tenantId}.lvh.me:{port}/verify/{token}
 */
class InitSessionHandler : public IHttpHandler {
public:
    InitSessionHandler(
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<SessionContextResolver> resolver
    ) : authService_(std::move(authService))
      , resolver_(std::move(resolver))
    {}

    void handle(IRequest& req, IResponse& res) override {
        std::string tenantId = req.getPathParam(0).value_or("");
        if (tenantId.empty()) {
            sendError(res, 400, "tenantId is required");
            return;
        }

        try {
            auto ctx = resolver_->resolve(req);
            auto result = authService_->initiateHandoff(ctx, tenantId);
            if (!result.success) {
                sendError(res, domain::httpStatusFor(result.error), result.message);
                return;
            }

            std::cout << "[InitSessionHandler] Redirecting to tenant " << tenantId << std::endl;
            res.setStatus(302);
            res.setHeader("Location", result.redirectUrl);

        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[InitSessionHandler] Session lookup failed: " << e.what() << std::endl;
            sendError(res, 500, "Session store unavailable");
        } catch (const std::exception& e) {
            std::cerr << "[InitSessionHandler] Handoff failed: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<SessionContextResolver> resolver_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace bridge::adapters::primary
