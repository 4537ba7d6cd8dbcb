#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include <StorageException.hpp>
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace atm::ports::output {

/**
 * @brief Единица работы с хранилищем: одна транзакция БД
 *
 * lockBalance() берёт эксклюзивную блокировку счёта до commit()/rollback().
 * writeBalance()/appendEntry() допустимы только для заблокированного счёта.
 * Деструктор откатывает незавершённую единицу работы.
 *
 * Любая ошибка сообщается через StorageException.
 */
class ILedgerUnitOfWork {
public:
    virtual ~ILedgerUnitOfWork() = default;

    /**
     * @brief Заблокировать счёт и прочитать баланс
     * @return std::nullopt если счёта нет
     */
    virtual std::optional<std::int64_t> lockBalance(domain::AccountId accountId) = 0;

    virtual void writeBalance(domain::AccountId accountId, std::int64_t balance) = 0;

    virtual void appendEntry(domain::AccountId accountId, std::int64_t signedAmount) = 0;

    virtual void commit() = 0;

    virtual void rollback() = 0;
};

/**
 * @brief Хранилище балансов и журнала операций
 */
class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual std::optional<domain::AccountId> findAccountByPin(const std::string& pin) = 0;

    virtual std::optional<std::int64_t> findBalance(domain::AccountId accountId) = 0;

    /**
     * @return std::nullopt если счёта нет
     */
    virtual std::optional<std::vector<domain::LedgerEntry>> findEntries(domain::AccountId accountId) = 0;

    virtual std::unique_ptr<ILedgerUnitOfWork> begin() = 0;
};

} // namespace atm::ports::output
