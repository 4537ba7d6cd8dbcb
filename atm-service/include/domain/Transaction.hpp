#pragma once

#include "Account.hpp"
#include "enums/TransactionKind.hpp"
#include <cstdint>

namespace atm::domain {

/**
 * @brief Запрошенная операция по счёту
 *
 * amount всегда неотрицательная величина, знак определяется kind.
 */
struct Transaction {
    TransactionKind kind = TransactionKind::DEPOSIT;
    std::int64_t amount = 0;

    Transaction() = default;

    Transaction(TransactionKind kind, std::int64_t amount)
        : kind(kind)
        , amount(amount)
    {}

    /**
     * @brief Изменение баланса: +amount для DEPOSIT, -amount для WITHDRAWAL
     */
    std::int64_t signedAmount() const {
        return kind == TransactionKind::WITHDRAWAL ? -amount : amount;
    }
};

/**
 * @brief Запись журнала операций (таблица transactions)
 *
 * Неизменяема после записи. amount хранится со знаком.
 */
struct LedgerEntry {
    std::int64_t entryId = 0;
    AccountId accountId = 0;
    std::int64_t amount = 0;

    LedgerEntry() = default;

    LedgerEntry(std::int64_t entryId, AccountId accountId, std::int64_t amount)
        : entryId(entryId)
        , accountId(accountId)
        , amount(amount)
    {}

    TransactionKind kind() const {
        return amount < 0 ? TransactionKind::WITHDRAWAL : TransactionKind::DEPOSIT;
    }
};

} // namespace atm::domain
