#pragma once

#include <cstdint>

namespace atm::domain {

/**
 * @brief Идентификатор счёта
 *
 * Счета заводятся вне сервиса (таблица users), здесь только читаются.
 */
using AccountId = std::int64_t;

} // namespace atm::domain
