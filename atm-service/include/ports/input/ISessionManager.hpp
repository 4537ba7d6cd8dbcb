#pragma once

#include "domain/Session.hpp"
#include <string>
#include <optional>
#include <cstddef>

namespace atm::ports::input {

/**
 * @brief Классификация предъявленного идентификатора сессии
 */
enum class SessionStatus {
    VALID,
    NOT_FOUND,
    EXPIRED
};

inline std::string toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::VALID:     return "VALID";
        case SessionStatus::NOT_FOUND: return "NOT_FOUND";
        case SessionStatus::EXPIRED:   return "EXPIRED";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Результат валидации сессии
 */
struct ValidateResult {
    SessionStatus status = SessionStatus::NOT_FOUND;
    domain::Session session;   ///< Заполнена при VALID и EXPIRED
    bool renewed = false;      ///< Срок был продлён при этой проверке
    std::string message;

    bool valid() const { return status == SessionStatus::VALID; }
};

/**
 * @brief Менеджер сессий
 *
 * Выдаёт, проверяет и продлевает сессии. Все методы потокобезопасны.
 */
class ISessionManager {
public:
    virtual ~ISessionManager() = default;

    /**
     * @brief Создать сессию для счёта со сроком now + TTL
     */
    virtual domain::Session createSession(domain::AccountId accountId) = 0;

    /**
     * @brief Проверить сессию
     *
     * Если до истечения осталось меньше порога продления,
     * срок продлевается до now + TTL в рамках этого же вызова.
     * Истёкшая сессия никогда не продлевается.
     */
    virtual ValidateResult validate(const std::string& sessionId) = 0;

    /**
     * @brief Продлить действующую сессию до now + TTL
     *
     * Не зависит от порога продления. Истёкшая сессия не меняется.
     *
     * @return std::nullopt если сессии нет или она уже истекла
     */
    virtual std::optional<domain::Session> renew(const std::string& sessionId) = 0;

    /**
     * @brief Удалить истёкшие сессии
     * @return Количество удалённых
     */
    virtual std::size_t purgeExpired() = 0;

    virtual std::size_t sessionCount() const = 0;
};

} // namespace atm::ports::input
