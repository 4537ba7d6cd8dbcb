#pragma once

#include <IRequest.hpp>
#include "domain/Account.hpp"
#include <string>
#include <stdexcept>

namespace atm::adapters::primary {

/**
 * @brief Достать accountId, положенный SessionAuthMiddleware
 *
 * @throws std::logic_error если запрос дошёл до обработчика книги счетов
 *         в обход проверки сессии (ошибка маршрутизации, не клиента)
 */
inline domain::AccountId requireAccountId(IRequest& req) {
    auto value = req.getAttribute("accountId");
    if (!value || value->empty()) {
        throw std::logic_error("Session must be resolved before ledger access");
    }
    return std::stoll(*value);
}

} // namespace atm::adapters::primary
