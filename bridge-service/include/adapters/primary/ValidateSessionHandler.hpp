#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include "adapters/primary/SessionContextResolver.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bridge::adapters::primary {

/**
 * @brief GET /api/auth/validate-session → 200 {"valid": true} | 401 {"valid": false}
 */
class ValidateSessionHandler : public IHttpHandler {
public:
    ValidateSessionHandler(
        std::shared_ptr<ports::input::IAuthService> authService,
        std::shared_ptr<SessionContextResolver> resolver
    ) : authService_(std::move(authService))
      , resolver_(std::move(resolver))
    {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        try {
            auto result = authService_->validateSession(resolver_->resolve(req));
            response["valid"] = result.valid;
            res.setResult(result.valid ? 200 : 401, "application/json", response.dump());
        } catch (const ports::output::SessionPersistenceError& e) {
            std::cerr << "[ValidateSessionHandler] Session lookup failed: " << e.what() << std::endl;
            response["error"] = "Session store unavailable";
            res.setResult(500, "application/json", response.dump());
        }
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    std::shared_ptr<SessionContextResolver> resolver_;
};

} // namespace bridge::adapters::primary
