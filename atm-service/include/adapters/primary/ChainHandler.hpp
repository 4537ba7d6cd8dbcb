#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <vector>
#include <iostream>

namespace atm::adapters::primary {

/**
 * @brief Цепочка обработчиков: middleware + конечный handler
 *
 * Middleware пропускает запрос дальше, оставляя статус 0.
 * Первый обработчик, установивший статус, завершает цепочку.
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
            if (res.getStatus() != 0)
                return;
        }

        std::cerr << "[ChainHandler] Error: chain finished, but status is zero" << std::endl;
        sendError(res, 500, "Internal server error");
    }

private:
    std::vector<std::shared_ptr<IHttpHandler>> handlers_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace atm::adapters::primary
