#pragma once

#include "ports/output/ILedgerStore.hpp"
#include <StorageException.hpp>
#include <memory>
#include <atomic>
#include <string>

namespace atm::tests::mocks {

/**
 * @brief Обёртка над хранилищем, которая падает на заданном шаге
 *
 * Шаг выполняется после вызова предыдущих шагов у настоящего хранилища,
 * поэтому откат реально отменяет уже сделанные записи.
 */
class FaultyLedgerStore : public ports::output::ILedgerStore {
public:
    enum class Step {
        NONE,
        BEGIN,
        LOCK_BALANCE,
        WRITE_BALANCE,
        APPEND_ENTRY,
        COMMIT
    };

    explicit FaultyLedgerStore(std::shared_ptr<ports::output::ILedgerStore> inner)
        : inner_(std::move(inner))
    {}

    void failOn(Step step) { failStep_ = step; }

    std::optional<domain::AccountId> findAccountByPin(const std::string& pin) override {
        return inner_->findAccountByPin(pin);
    }

    std::optional<std::int64_t> findBalance(domain::AccountId accountId) override {
        return inner_->findBalance(accountId);
    }

    std::optional<std::vector<domain::LedgerEntry>> findEntries(domain::AccountId accountId) override {
        return inner_->findEntries(accountId);
    }

    std::unique_ptr<ports::output::ILedgerUnitOfWork> begin() override {
        failIf(Step::BEGIN);
        return std::make_unique<UnitOfWork>(*this, inner_->begin());
    }

    static std::string toString(Step step) {
        switch (step) {
            case Step::NONE:          return "NONE";
            case Step::BEGIN:         return "BEGIN";
            case Step::LOCK_BALANCE:  return "LOCK_BALANCE";
            case Step::WRITE_BALANCE: return "WRITE_BALANCE";
            case Step::APPEND_ENTRY:  return "APPEND_ENTRY";
            case Step::COMMIT:        return "COMMIT";
            default: return "UNKNOWN";
        }
    }

private:
    class UnitOfWork : public ports::output::ILedgerUnitOfWork {
    public:
        UnitOfWork(FaultyLedgerStore& owner, std::unique_ptr<ports::output::ILedgerUnitOfWork> inner)
            : owner_(owner)
            , inner_(std::move(inner))
        {}

        std::optional<std::int64_t> lockBalance(domain::AccountId accountId) override {
            owner_.failIf(Step::LOCK_BALANCE);
            return inner_->lockBalance(accountId);
        }

        void writeBalance(domain::AccountId accountId, std::int64_t balance) override {
            owner_.failIf(Step::WRITE_BALANCE);
            inner_->writeBalance(accountId, balance);
        }

        void appendEntry(domain::AccountId accountId, std::int64_t signedAmount) override {
            owner_.failIf(Step::APPEND_ENTRY);
            inner_->appendEntry(accountId, signedAmount);
        }

        void commit() override {
            owner_.failIf(Step::COMMIT);
            inner_->commit();
        }

        void rollback() override {
            inner_->rollback();
        }

    private:
        FaultyLedgerStore& owner_;
        std::unique_ptr<ports::output::ILedgerUnitOfWork> inner_;
    };

    std::shared_ptr<ports::output::ILedgerStore> inner_;
    std::atomic<Step> failStep_{Step::NONE};

    void failIf(Step step) const {
        if (failStep_.load() == step) {
            throw StorageException("injected failure at " + toString(step));
        }
    }
};

} // namespace atm::tests::mocks
