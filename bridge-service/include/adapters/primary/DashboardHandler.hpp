#pragma once

#include <IHttpHandler.hpp>
#include "application/DomainRouter.hpp"

namespace bridge::adapters::primary {

/**
 * @brief GET /api/tenant/dashboard
 */
class DashboardHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        std::string host = application::DomainRouter::hostnameOf(req.getHeader("Host").value_or(""));
        std::string principalId = req.getAttribute("principalId").value_or("");
        if (principalId.empty()) {
            res.setResult(401, "text/plain", "Not logged in");
            return;
        }
        res.setResult(200, "text/plain", "Welcome to " + host + ", user: " + principalId);
    }
};

} // namespace bridge::adapters::primary
