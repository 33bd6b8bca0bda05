#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IAuthService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace bridge::adapters::primary {

/**
 * @brief Профиль текущего пользователя
 *
 * GET /api/users/login/me  → {id, email, name, tenants}
 * GET /api/users/tenant/me → {id, email, name, tenantId}
 *
 * principalId/tenantId кладёт SessionGuardMiddleware.
 */
class ProfileHandler : public IHttpHandler {
public:
    enum class View { LOGIN, TENANT };

    ProfileHandler(std::shared_ptr<ports::input::IAuthService> authService, View view)
        : authService_(std::move(authService))
        , view_(view)
    {}

    void handle(IRequest& req, IResponse& res) override {
        std::string principalId = req.getAttribute("principalId").value_or("");
        auto principal = authService_->currentPrincipal(principalId);
        if (!principal) {
            std::cerr << "[ProfileHandler] User not found: " << principalId << std::endl;
            sendError(res, 401, "Unauthorized: User not found");
            return;
        }

        nlohmann::json response;
        response["id"] = principal->id;
        response["email"] = principal->email;
        response["name"] = principal->name;
        if (view_ == View::LOGIN) {
            response["tenants"] = principal->tenants;
        } else {
            response["tenantId"] = req.getAttribute("tenantId").value_or("");
        }

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::IAuthService> authService_;
    View view_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace bridge::adapters::primary
