#pragma once

#include <IHttpHandler.hpp>
#include "AuthenticatedRequest.hpp"
#include "ports/input/ILedgerService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace atm::adapters::primary {

/**
 * @brief GET /api/v1/transactions - журнал операций счёта
 *
 * Response:
 * {
 *   "transactions": [
 *     { "id": 1, "amount": 100, "kind": "DEPOSIT" },
 *     { "id": 2, "amount": -30, "kind": "WITHDRAWAL" }
 *   ]
 * }
 */
class GetTransactionsHandler : public IHttpHandler {
public:
    explicit GetTransactionsHandler(
        std::shared_ptr<ports::input::ILedgerService> ledgerService
    ) : ledgerService_(std::move(ledgerService))
    {
        std::cout << "[GetTransactionsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            sendError(res, 405, "not allowed");
            return;
        }

        auto accountId = requireAccountId(req);
        auto result = ledgerService_->getTransactions(accountId);

        if (result.status == ports::input::LedgerStatus::ACCOUNT_NOT_FOUND) {
            sendError(res, 404, result.message);
            return;
        }
        if (!result.success()) {
            sendError(res, 500, "failed to get transactions");
            return;
        }

        nlohmann::json items = nlohmann::json::array();
        for (const auto& entry : result.entries) {
            nlohmann::json item;
            item["id"] = entry.entryId;
            item["amount"] = entry.amount;
            item["kind"] = domain::toString(entry.kind());
            items.push_back(item);
        }

        nlohmann::json response;
        response["transactions"] = items;
        res.setResult(200, "application/json", response.dump());
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
