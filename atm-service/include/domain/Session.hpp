#pragma once

#include "Account.hpp"
#include <string>
#include <chrono>

namespace atm::domain {

/**
 * @brief Сессия банкомата
 *
 * Создаётся после успешной проверки PIN. sessionId и accountId
 * не меняются, продление сдвигает только expiresAt.
 */
struct Session {
    std::string sessionId;                             ///< UUID v4
    AccountId accountId = 0;                           ///< Владелец сессии
    std::chrono::system_clock::time_point createdAt;   ///< Время создания
    std::chrono::system_clock::time_point expiresAt;   ///< Время истечения

    Session() = default;

    Session(const std::string& sessionId,
            AccountId accountId,
            std::chrono::system_clock::time_point now,
            std::chrono::seconds lifetime)
        : sessionId(sessionId)
        , accountId(accountId)
        , createdAt(now)
        , expiresAt(now + lifetime)
    {}

    /**
     * @brief Сессия непригодна начиная с момента expiresAt
     */
    bool isExpired(std::chrono::system_clock::time_point now) const {
        return now >= expiresAt;
    }

    std::chrono::system_clock::duration remaining(std::chrono::system_clock::time_point now) const {
        return expiresAt - now;
    }

    void renew(std::chrono::system_clock::time_point now, std::chrono::seconds lifetime) {
        expiresAt = now + lifetime;
    }
};

} // namespace atm::domain
