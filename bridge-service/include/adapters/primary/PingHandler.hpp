#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IClock.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace bridge::adapters::primary {

/**
 * @brief GET /api/tenant/ping
 *
 * lastActivity уже обновлён guard'ом тенанта, здесь только ответ.
 */
class PingHandler : public IHttpHandler {
public:
    explicit PingHandler(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            clock_->now().time_since_epoch()).count();

        nlohmann::json response;
        response["success"] = true;
        response["message"] = "Session refreshed";
        response["timestamp"] = ms;

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace bridge::adapters::primary
