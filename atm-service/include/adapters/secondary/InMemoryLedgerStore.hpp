#pragma once

#include "ports/output/ILedgerStore.hpp"
#include <StorageException.hpp>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <atomic>
#include <functional>
#include <iostream>

namespace atm::adapters::secondary {

/**
 * @brief In-memory хранилище книги счетов
 *
 * У каждого счёта свой мьютекс. Единица работы держит его от lockBalance()
 * до commit()/rollback(), читатели (findBalance/findEntries) тоже берут его,
 * поэтому баланс не читается посреди незавершённой операции.
 * Записи применяются сразу и сохраняются в журнале отмены,
 * rollback() проигрывает журнал в обратном порядке.
 */
class InMemoryLedgerStore : public ports::output::ILedgerStore {
    struct AccountRecord {
        std::string pin;
        std::int64_t balance = 0;
        std::vector<domain::LedgerEntry> entries;
        std::mutex mutex;
    };

public:
    class UnitOfWork : public ports::output::ILedgerUnitOfWork {
    public:
        explicit UnitOfWork(InMemoryLedgerStore& store) : store_(store) {}

        ~UnitOfWork() override {
            if (active_) {
                rollbackNoThrow();
            }
        }

        std::optional<std::int64_t> lockBalance(domain::AccountId accountId) override {
            ensureActive();

            auto it = locks_.find(accountId);
            if (it != locks_.end()) {
                return it->second.record->balance;
            }

            auto record = store_.findRecord(accountId);
            if (!record) {
                return std::nullopt;
            }

            std::unique_lock<std::mutex> lock(record->mutex);
            auto balance = record->balance;
            locks_.emplace(accountId, Lease{record, std::move(lock)});
            return balance;
        }

        void writeBalance(domain::AccountId accountId, std::int64_t balance) override {
            auto& record = lockedRecord(accountId);
            auto previous = record.balance;
            undo_.push_back([&record, previous]() { record.balance = previous; });
            record.balance = balance;
        }

        void appendEntry(domain::AccountId accountId, std::int64_t signedAmount) override {
            auto& record = lockedRecord(accountId);
            record.entries.emplace_back(store_.nextEntryId_++, accountId, signedAmount);
            undo_.push_back([&record]() { record.entries.pop_back(); });
        }

        void commit() override {
            ensureActive();
            undo_.clear();
            finish();
        }

        void rollback() override {
            ensureActive();
            rollbackNoThrow();
        }

    private:
        struct Lease {
            std::shared_ptr<AccountRecord> record;
            std::unique_lock<std::mutex> lock;
        };

        InMemoryLedgerStore& store_;
        std::unordered_map<domain::AccountId, Lease> locks_;
        std::vector<std::function<void()>> undo_;
        bool active_ = true;

        void ensureActive() const {
            if (!active_) {
                throw StorageException("Unit of work already finished");
            }
        }

        AccountRecord& lockedRecord(domain::AccountId accountId) {
            ensureActive();
            auto it = locks_.find(accountId);
            if (it == locks_.end()) {
                throw StorageException("Account " + std::to_string(accountId) + " is not locked by this unit of work");
            }
            return *it->second.record;
        }

        void rollbackNoThrow() noexcept {
            for (auto it = undo_.rbegin(); it != undo_.rend(); ++it) {
                (*it)();
            }
            undo_.clear();
            finish();
        }

        void finish() noexcept {
            locks_.clear();
            active_ = false;
        }
    };

    InMemoryLedgerStore() {
        std::cout << "[InMemoryLedgerStore] Created" << std::endl;
    }

    /**
     * @brief Завести счёт (вне основного протокола, для seed и тестов)
     * @throws StorageException если PIN уже занят
     */
    domain::AccountId provision(const std::string& pin, std::int64_t initialBalance) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (pinIndex_.count(pin) > 0) {
            throw StorageException("PIN already provisioned");
        }

        domain::AccountId accountId = nextAccountId_++;
        auto record = std::make_shared<AccountRecord>();
        record->pin = pin;
        record->balance = initialBalance;
        accounts_.emplace(accountId, record);
        pinIndex_.emplace(pin, accountId);
        return accountId;
    }

    std::optional<domain::AccountId> findAccountByPin(const std::string& pin) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = pinIndex_.find(pin);
        if (it == pinIndex_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<std::int64_t> findBalance(domain::AccountId accountId) override {
        auto record = findRecord(accountId);
        if (!record) return std::nullopt;

        std::lock_guard<std::mutex> lock(record->mutex);
        return record->balance;
    }

    std::optional<std::vector<domain::LedgerEntry>> findEntries(domain::AccountId accountId) override {
        auto record = findRecord(accountId);
        if (!record) return std::nullopt;

        std::lock_guard<std::mutex> lock(record->mutex);
        return record->entries;
    }

    std::unique_ptr<ports::output::ILedgerUnitOfWork> begin() override {
        return std::make_unique<UnitOfWork>(*this);
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<domain::AccountId, std::shared_ptr<AccountRecord>> accounts_;
    std::unordered_map<std::string, domain::AccountId> pinIndex_;
    domain::AccountId nextAccountId_ = 1;
    std::atomic<std::int64_t> nextEntryId_{1};

    std::shared_ptr<AccountRecord> findRecord(domain::AccountId accountId) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = accounts_.find(accountId);
        return it != accounts_.end() ? it->second : nullptr;
    }
};

} // namespace atm::adapters::secondary
