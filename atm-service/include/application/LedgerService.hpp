#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "settings/LedgerSettings.hpp"
#include <StorageException.hpp>
#include <memory>
#include <limits>
#include <iostream>

namespace atm::application {

/**
 * @brief Сервис книги счетов
 *
 * Проведение операции:
 * 1. begin()        - открыть единицу работы
 * 2. lockBalance()  - заблокировать счёт и прочитать баланс
 * 3. новый баланс = текущий + signedAmount()
 * 4. writeBalance() - записать баланс
 * 5. appendEntry()  - добавить запись в журнал
 * 6. commit()
 *
 * StorageException на любом шаге откатывает единицу работы целиком:
 * ни баланс, ни журнал не меняются. Исключение - обрыв связи во время
 * COMMIT (StorageOutcomeUnknownException): исход неизвестен, сообщается
 * отдельным сообщением. Блокировка счёта в шаге 2
 * сериализует операции по одному счёту, разные счета не ждут друг друга.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<settings::LedgerSettings> settings,
        std::shared_ptr<ports::output::ILedgerStore> store
    ) : settings_(std::move(settings))
      , store_(std::move(store))
    {
        std::cout << "[LedgerService] Created (overdraft "
                  << (settings_->isOverdraftAllowed() ? "allowed" : "rejected") << ")" << std::endl;
    }

    ports::input::ResolveResult resolveAccount(const std::string& pin) override {
        using ports::input::LedgerStatus;

        try {
            auto accountId = store_->findAccountByPin(pin);
            if (!accountId) {
                std::cout << "[LedgerService] Unknown PIN" << std::endl;
                return {LedgerStatus::AUTHENTICATION_FAILED, 0, "Invalid PIN"};
            }
            return {LedgerStatus::OK, *accountId, "Authenticated"};

        } catch (const StorageException& e) {
            std::cerr << "[LedgerService] resolveAccount() failed: " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, 0, "Storage unavailable"};
        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] resolveAccount() error: " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, 0, "Storage unavailable"};
        }
    }

    ports::input::BalanceResult getBalance(domain::AccountId accountId) override {
        using ports::input::LedgerStatus;

        try {
            auto balance = store_->findBalance(accountId);
            if (!balance) {
                return {LedgerStatus::ACCOUNT_NOT_FOUND, 0, "Account not found"};
            }
            return {LedgerStatus::OK, *balance, "OK"};

        } catch (const StorageException& e) {
            std::cerr << "[LedgerService] getBalance() failed for account " << accountId
                      << ": " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, 0, "Storage unavailable"};
        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] getBalance() error for account " << accountId
                      << ": " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, 0, "Storage unavailable"};
        }
    }

    ports::input::TransactionResult applyTransaction(
        domain::AccountId accountId,
        const domain::Transaction& transaction
    ) override {
        using ports::input::LedgerStatus;

        if (transaction.amount < 0) {
            return {LedgerStatus::MALFORMED_INPUT, 0, "Amount must be non-negative"};
        }

        try {
            auto uow = store_->begin();

            auto current = uow->lockBalance(accountId);
            if (!current) {
                uow->rollback();
                return {LedgerStatus::ACCOUNT_NOT_FOUND, 0, "Account not found"};
            }

            std::int64_t delta = transaction.signedAmount();
            if (wouldOverflow(*current, delta)) {
                uow->rollback();
                return {LedgerStatus::MALFORMED_INPUT, 0, "Amount out of range"};
            }

            std::int64_t updated = *current + delta;
            if (updated < 0 && delta < 0 && !settings_->isOverdraftAllowed()) {
                uow->rollback();
                std::cout << "[LedgerService] Rejected " << domain::toString(transaction.kind)
                          << " of " << transaction.amount << " for account " << accountId
                          << ": insufficient funds" << std::endl;
                return {LedgerStatus::INSUFFICIENT_FUNDS, *current, "Insufficient funds"};
            }

            uow->writeBalance(accountId, updated);
            uow->appendEntry(accountId, delta);
            uow->commit();

            std::cout << "[LedgerService] " << domain::toString(transaction.kind) << " "
                      << transaction.amount << " for account " << accountId
                      << " committed, balance " << updated << std::endl;
            return {LedgerStatus::OK, updated, "OK"};

        } catch (const StorageOutcomeUnknownException& e) {
            std::cerr << "[LedgerService] " << domain::toString(transaction.kind)
                      << " for account " << accountId << " outcome unknown: " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, 0, "Transaction outcome unknown"};

        } catch (const StorageException& e) {
            // Незавершённая единица работы откатывается деструктором
            std::cerr << "[LedgerService] " << domain::toString(transaction.kind)
                      << " for account " << accountId << " rolled back: " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, 0, "Transaction failed"};

        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] " << domain::toString(transaction.kind)
                      << " for account " << accountId << " aborted: " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, 0, "Transaction failed"};
        }
    }

    ports::input::HistoryResult getTransactions(domain::AccountId accountId) override {
        using ports::input::LedgerStatus;

        try {
            auto entries = store_->findEntries(accountId);
            if (!entries) {
                return {LedgerStatus::ACCOUNT_NOT_FOUND, {}, "Account not found"};
            }
            return {LedgerStatus::OK, std::move(*entries), "OK"};

        } catch (const StorageException& e) {
            std::cerr << "[LedgerService] getTransactions() failed for account " << accountId
                      << ": " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, {}, "Storage unavailable"};
        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] getTransactions() error for account " << accountId
                      << ": " << e.what() << std::endl;
            return {LedgerStatus::STORAGE_FAILURE, {}, "Storage unavailable"};
        }
    }

private:
    std::shared_ptr<settings::LedgerSettings> settings_;
    std::shared_ptr<ports::output::ILedgerStore> store_;

    static bool wouldOverflow(std::int64_t balance, std::int64_t delta) {
        if (delta > 0) {
            return balance > std::numeric_limits<std::int64_t>::max() - delta;
        }
        return balance < std::numeric_limits<std::int64_t>::min() - delta;
    }
};

} // namespace atm::application
