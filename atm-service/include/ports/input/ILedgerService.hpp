#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace atm::ports::input {

/**
 * @brief Исход операции с книгой счетов
 */
enum class LedgerStatus {
    OK,
    AUTHENTICATION_FAILED,   ///< PIN не найден
    ACCOUNT_NOT_FOUND,
    INSUFFICIENT_FUNDS,      ///< Снятие запрещено политикой овердрафта
    MALFORMED_INPUT,         ///< Отрицательная сумма или переполнение
    STORAGE_FAILURE          ///< Ошибка хранилища, изменения откатены
};

inline std::string toString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::OK:                    return "OK";
        case LedgerStatus::AUTHENTICATION_FAILED: return "AUTHENTICATION_FAILED";
        case LedgerStatus::ACCOUNT_NOT_FOUND:     return "ACCOUNT_NOT_FOUND";
        case LedgerStatus::INSUFFICIENT_FUNDS:    return "INSUFFICIENT_FUNDS";
        case LedgerStatus::MALFORMED_INPUT:       return "MALFORMED_INPUT";
        case LedgerStatus::STORAGE_FAILURE:       return "STORAGE_FAILURE";
        default: return "UNKNOWN";
    }
}

struct ResolveResult {
    LedgerStatus status = LedgerStatus::AUTHENTICATION_FAILED;
    domain::AccountId accountId = 0;
    std::string message;

    bool success() const { return status == LedgerStatus::OK; }
};

struct BalanceResult {
    LedgerStatus status = LedgerStatus::ACCOUNT_NOT_FOUND;
    std::int64_t balance = 0;
    std::string message;

    bool success() const { return status == LedgerStatus::OK; }
};

struct TransactionResult {
    LedgerStatus status = LedgerStatus::STORAGE_FAILURE;
    std::int64_t balance = 0;   ///< Новый баланс при OK
    std::string message;

    bool success() const { return status == LedgerStatus::OK; }
};

struct HistoryResult {
    LedgerStatus status = LedgerStatus::ACCOUNT_NOT_FOUND;
    std::vector<domain::LedgerEntry> entries;
    std::string message;

    bool success() const { return status == LedgerStatus::OK; }
};

/**
 * @brief Сервис книги счетов
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Найти счёт по PIN (точное совпадение)
     */
    virtual ResolveResult resolveAccount(const std::string& pin) = 0;

    /**
     * @brief Текущий баланс с учётом всех зафиксированных операций
     */
    virtual BalanceResult getBalance(domain::AccountId accountId) = 0;

    /**
     * @brief Провести операцию: запись баланса и журнала одной транзакцией
     *
     * При любом исходе кроме OK баланс и журнал остаются прежними.
     */
    virtual TransactionResult applyTransaction(
        domain::AccountId accountId,
        const domain::Transaction& transaction
    ) = 0;

    /**
     * @brief Журнал операций по счёту в порядке записи
     */
    virtual HistoryResult getTransactions(domain::AccountId accountId) = 0;
};

} // namespace atm::ports::input
