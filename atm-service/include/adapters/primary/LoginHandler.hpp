#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ILedgerService.hpp"
#include "ports/input/ISessionManager.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <chrono>
#include <iostream>

namespace atm::adapters::primary {

/**
 * @brief Вход по PIN
 *
 * POST /api/v1/login
 * nip: 4623                      (заголовок)
 * либо тело { "pin": "4623" }
 *
 * Response:
 * SessionID: <uuid>              (заголовок)
 * {
 *   "session_id": "<uuid>",
 *   "account_id": 1,
 *   "expires_at": 1760000000     (unix seconds)
 * }
 */
class LoginHandler : public IHttpHandler {
public:
    LoginHandler(
        std::shared_ptr<ports::input::ILedgerService> ledgerService,
        std::shared_ptr<ports::input::ISessionManager> sessionManager
    ) : ledgerService_(std::move(ledgerService))
      , sessionManager_(std::move(sessionManager))
    {
        std::cout << "[LoginHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "POST") {
            sendError(res, 405, "not allowed");
            return;
        }

        try {
            std::string pin = extractPin(req);
            if (pin.empty()) {
                sendError(res, 400, "missing header: 'nip'");
                return;
            }

            auto resolved = ledgerService_->resolveAccount(pin);
            if (resolved.status == ports::input::LedgerStatus::STORAGE_FAILURE) {
                sendError(res, 500, resolved.message);
                return;
            }
            if (!resolved.success()) {
                std::cerr << "[LoginHandler] Login rejected: invalid nip" << std::endl;
                sendError(res, 401, "invalid nip");
                return;
            }

            auto session = sessionManager_->createSession(resolved.accountId);

            nlohmann::json response;
            response["session_id"] = session.sessionId;
            response["account_id"] = session.accountId;
            response["expires_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                session.expiresAt.time_since_epoch()).count();

            res.setHeader("SessionID", session.sessionId);
            res.setResult(200, "application/json", response.dump());

            std::cout << "[LoginHandler] Login succeeded for account " << resolved.accountId << std::endl;

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON");
        } catch (const std::exception& e) {
            std::cerr << "[LoginHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledgerService_;
    std::shared_ptr<ports::input::ISessionManager> sessionManager_;

    static std::string extractPin(IRequest& req) {
        auto header = req.getHeader("nip");
        if (header && !header->empty()) {
            return *header;
        }
        if (req.getBody().empty()) {
            return "";
        }
        auto body = nlohmann::json::parse(req.getBody());
        return body.value("pin", "");
    }

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace atm::adapters::primary
