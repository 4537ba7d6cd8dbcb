#pragma once

#include <IHttpHandler.hpp>
#include "AuthenticatedRequest.hpp"
#include "ports/input/ILedgerService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace atm::adapters::primary {

/**
 * @brief GET /api/v1/balance - текущий баланс счёта сессии
 *
 * Ставится в ChainHandler после SessionAuthMiddleware.
 */
class GetBalanceHandler : public IHttpHandler {
public:
    explicit GetBalanceHandler(
        std::shared_ptr<ports::input::ILedgerService> ledgerService
    ) : ledgerService_(std::move(ledgerService))
    {
        std::cout << "[GetBalanceHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "not allowed");
            return;
        }

        auto accountId = requireAccountId(req);
        auto result = ledgerService_->getBalance(accountId);

        switch (result.status) {
            case ports::input::LedgerStatus::OK: {
                nlohmann::json response;
                response["balance"] = result.balance;
                res.setResult(200, "application/json", response.dump());
                return;
            }
            case ports::input::LedgerStatus::ACCOUNT_NOT_FOUND:
                sendError(res, 404, result.message);
                return;
            default:
                std::cerr << "[GetBalanceHandler] Failed to get balance for account "
                          << accountId << ": " << result.message << std::endl;
                sendError(res, 500, "failed to get balance");
                return;
        }
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace atm::adapters::primary
