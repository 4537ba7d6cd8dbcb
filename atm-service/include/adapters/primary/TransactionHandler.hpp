#pragma once

#include <IHttpHandler.hpp>
#include "AuthenticatedRequest.hpp"
#include "ports/input/ILedgerService.hpp"
#include "domain/Transaction.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <limits>
#include <cstdint>
#include <iostream>

namespace atm::adapters::primary {

/**
 * @brief Внесение и снятие наличных
 *
 * POST /api/v1/deposit   (kind = DEPOSIT)
 * POST /api/v1/withdraw  (kind = WITHDRAWAL)
 *
 * Тело: целое число (100) или { "amount": 100 }.
 * Некорректная сумма отклоняется с 400 до обращения к хранилищу.
 *
 * Response: { "status": "ok", "balance": 150 }
 */
class TransactionHandler : public IHttpHandler {
public:
    TransactionHandler(
        std::shared_ptr<ports::input::ILedgerService> ledgerService,
        domain::TransactionKind kind
    ) : ledgerService_(std::move(ledgerService))
      , kind_(kind)
    {
        std::cout << "[TransactionHandler] Created for " << domain::toString(kind_) << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "not allowed");
            return;
        }

        auto accountId = requireAccountId(req);

        auto amount = parseAmount(req.getBody());
        if (!amount) {
            std::cerr << "[TransactionHandler] Failed to decode " << domain::toString(kind_)
                      << " amount" << std::endl;
            sendError(res, 400, "invalid amount");
            return;
        }

        auto result = ledgerService_->applyTransaction(accountId, domain::Transaction(kind_, *amount));

        using ports::input::LedgerStatus;
        switch (result.status) {
            case LedgerStatus::OK: {
                nlohmann::json response;
                response["status"] = "ok";
                response["balance"] = result.balance;
                res.setResult(200, "application/json", response.dump());
                return;
            }
            case LedgerStatus::MALFORMED_INPUT:
                sendError(res, 400, result.message);
                return;
            case LedgerStatus::ACCOUNT_NOT_FOUND:
                sendError(res, 404, result.message);
                return;
            case LedgerStatus::INSUFFICIENT_FUNDS:
                sendError(res, 409, result.message);
                return;
            default:
                sendError(res, 500, kind_ == domain::TransactionKind::DEPOSIT
                                        ? "failed to perform deposit"
                                        : "failed to perform withdrawal");
                return;
        }
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    domain::TransactionKind kind_;

    /**
     * @return std::nullopt если тело не целое неотрицательное число
     */
    static std::optional<std::int64_t> parseAmount(const std::string& body) {
        try {
            auto parsed = nlohmann::json::parse(body);
            if (parsed.is_object() && !parsed.contains("amount")) {
                return std::nullopt;
            }
            const auto& json = parsed.is_object() ? parsed.at("amount") : parsed;

            if (json.is_number_unsigned()) {
                auto value = json.get<std::uint64_t>();
                if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    return std::nullopt;
                }
                return static_cast<std::int64_t>(value);
            }
            if (json.is_number_integer()) {
                auto value = json.get<std::int64_t>();
                if (value < 0) return std::nullopt;
                return value;
            }
            return std::nullopt;

        } catch (const nlohmann::json::exception&) {
            return std::nullopt;
        }
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace atm::adapters::primary
