#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <vector>

namespace bridge::adapters::primary {

/**
 * @brief Цепочка middleware → handler
 *
 * Обработчик, оставивший статус 0, передаёт запрос следующему.
 * Первый выставленный статус завершает цепочку.
 */
class ChainHandler : public IHttpHandler {
public:
    template <typename... Handlers>
    explicit ChainHandler(Handlers&&... handlers) {
        (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
    }

    void handle(IRequest& req, IResponse& res) override {
        for (auto& h : handlers_) {
            h->handle(req, res);
            if (res.getStatus() != 0) {
                return;
            }
        }

        std::cerr << "[ChainHandler] Error: chain finished, but status is zero" << std::endl;
        nlohmann::json error;
        error["error"] = "Internal server error";
        res.setResult(500, "application/json", error.dump());
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;
};

} // namespace bridge::adapters::primary
