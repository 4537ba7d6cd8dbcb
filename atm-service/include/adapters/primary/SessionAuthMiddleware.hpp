#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionManager.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <algorithm>
#include <cctype>
#include <iostream>

namespace atm::adapters::primary {

/**
 * @brief Middleware проверки сессии
 *
 * Authorization: <session-id> или Authorization: Bearer <session-id>
 *
 * При валидной сессии кладёт в attributes accountId и sessionId
 * и оставляет статус 0, чтобы ChainHandler продолжил цепочку.
 * Продление сессии происходит внутри ISessionManager::validate().
 */
class SessionAuthMiddleware : public IHttpHandler {
public:
    explicit SessionAuthMiddleware(
        std::shared_ptr<ports::input::ISessionManager> sessionManager
    ) : sessionManager_(std::move(sessionManager))
    {
        std::cout << "[SessionAuthMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string header = req.getHeader("Authorization").value_or("");
        if (header.empty()) {
            std::cerr << "[SessionAuthMiddleware] Missing Authorization header" << std::endl;
            sendError(res, 401, "unauthorized");
            return;
        }

        std::string token = req.getBearerToken().value_or(header);
        if (!utils::UuidGenerator::isValid(token)) {
            std::cerr << "[SessionAuthMiddleware] Not a session id: " << token << std::endl;
            sendError(res, 400, "invalid authorization");
            return;
        }

        // Идентификаторы выдаются в нижнем регистре
        std::transform(token.begin(), token.end(), token.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        auto result = sessionManager_->validate(token);
        switch (result.status) {
            case ports::input::SessionStatus::NOT_FOUND:
                std::cerr << "[SessionAuthMiddleware] Unknown session" << std::endl;
                sendError(res, 401, "invalid authorization");
                return;

            case ports::input::SessionStatus::EXPIRED:
                std::cerr << "[SessionAuthMiddleware] Session expired for account "
                          << result.session.accountId << std::endl;
                sendError(res, 401, "session expired");
                return;

            case ports::input::SessionStatus::VALID:
                break;
        }

        req.setAttribute("accountId", std::to_string(result.session.accountId));
        req.setAttribute("sessionId", result.session.sessionId);
        res.setStatus(0); // для middleware
    }

private:
    std::shared_ptr<ports::input::ISessionManager> sessionManager_;

    void sendError(IResponse& res, int status, const std::string& message) {
        nlohmann::json error;
        error["error"] = message;
        res.setResult(status, "application/json", error.dump());
    }
};

} // namespace atm::adapters::primary
