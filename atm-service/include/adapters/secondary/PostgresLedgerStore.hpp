#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "PgConnectionPool.hpp"
#include <StorageException.hpp>
#include <pqxx/pqxx>
#include <memory>
#include <unordered_set>
#include <iostream>

namespace atm::adapters::secondary {

/**
 * @brief Книга счетов в PostgreSQL
 *
 * Таблицы users(id, pin, balance) и transactions(id, amount, user_id),
 * см. sql/schema.sql. Единица работы = одна pqxx::work на арендованном
 * соединении. lockBalance() делает SELECT ... FOR UPDATE: строка счёта
 * заблокирована до COMMIT/ROLLBACK, остальные счета не затронуты.
 */
class PostgresLedgerStore : public ports::output::ILedgerStore {
public:
    class UnitOfWork : public ports::output::ILedgerUnitOfWork {
    public:
        explicit UnitOfWork(PgConnectionPool::Lease lease)
            : lease_(std::move(lease))
        {
            try {
                txn_ = std::make_unique<pqxx::work>(*lease_);
            } catch (const std::exception& e) {
                throw StorageException(std::string("BEGIN failed: ") + e.what());
            }
        }

        ~UnitOfWork() override {
            // pqxx::work без commit() откатывается в деструкторе
            txn_.reset();
        }

        std::optional<std::int64_t> lockBalance(domain::AccountId accountId) override {
            ensureActive();
            try {
                auto result = txn_->exec_params(
                    "SELECT balance FROM users WHERE id = $1 FOR UPDATE",
                    accountId
                );
                if (result.empty()) return std::nullopt;

                locked_.insert(accountId);
                return result[0]["balance"].as<std::int64_t>();

            } catch (const std::exception& e) {
                throw StorageException(std::string("lockBalance() failed: ") + e.what());
            }
        }

        void writeBalance(domain::AccountId accountId, std::int64_t balance) override {
            ensureLocked(accountId);
            try {
                auto result = txn_->exec_params(
                    "UPDATE users SET balance = $2 WHERE id = $1",
                    accountId,
                    balance
                );
                if (result.affected_rows() != 1) {
                    throw StorageException("writeBalance() updated " +
                                           std::to_string(result.affected_rows()) + " rows");
                }
            } catch (const StorageException&) {
                throw;
            } catch (const std::exception& e) {
                throw StorageException(std::string("writeBalance() failed: ") + e.what());
            }
        }

        void appendEntry(domain::AccountId accountId, std::int64_t signedAmount) override {
            ensureLocked(accountId);
            try {
                txn_->exec_params(
                    "INSERT INTO transactions (amount, user_id) VALUES ($1, $2)",
                    signedAmount,
                    accountId
                );
            } catch (const std::exception& e) {
                throw StorageException(std::string("appendEntry() failed: ") + e.what());
            }
        }

        void commit() override {
            ensureActive();
            try {
                txn_->commit();
                finished_ = true;
            } catch (const pqxx::in_doubt_error& e) {
                finished_ = true;
                throw StorageOutcomeUnknownException(std::string("COMMIT outcome unknown: ") + e.what());
            } catch (const std::exception& e) {
                finished_ = true;
                throw StorageException(std::string("COMMIT failed: ") + e.what());
            }
        }

        void rollback() override {
            ensureActive();
            finished_ = true;
            try {
                txn_->abort();
            } catch (const std::exception& e) {
                throw StorageException(std::string("ROLLBACK failed: ") + e.what());
            }
        }

    private:
        PgConnectionPool::Lease lease_;
        std::unique_ptr<pqxx::work> txn_;
        std::unordered_set<domain::AccountId> locked_;
        bool finished_ = false;

        void ensureActive() const {
            if (finished_) {
                throw StorageException("Unit of work already finished");
            }
        }

        void ensureLocked(domain::AccountId accountId) const {
            ensureActive();
            if (locked_.count(accountId) == 0) {
                throw StorageException("Account " + std::to_string(accountId) + " is not locked by this unit of work");
            }
        }
    };

    explicit PostgresLedgerStore(std::shared_ptr<PgConnectionPool> pool)
        : pool_(std::move(pool))
    {
        std::cout << "[PostgresLedgerStore] Created" << std::endl;
    }

    std::optional<domain::AccountId> findAccountByPin(const std::string& pin) override {
        try {
            auto lease = pool_->acquire();
            pqxx::work txn(*lease);

            auto result = txn.exec_params("SELECT id FROM users WHERE pin = $1", pin);
            txn.commit();

            if (result.empty()) return std::nullopt;
            return result[0]["id"].as<domain::AccountId>();

        } catch (const StorageException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findAccountByPin() failed: " << e.what() << std::endl;
            throw StorageException(e.what());
        }
    }

    std::optional<std::int64_t> findBalance(domain::AccountId accountId) override {
        try {
            auto lease = pool_->acquire();
            pqxx::work txn(*lease);

            auto result = txn.exec_params("SELECT balance FROM users WHERE id = $1", accountId);
            txn.commit();

            if (result.empty()) return std::nullopt;
            return result[0]["balance"].as<std::int64_t>();

        } catch (const StorageException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findBalance() failed: " << e.what() << std::endl;
            throw StorageException(e.what());
        }
    }

    std::optional<std::vector<domain::LedgerEntry>> findEntries(domain::AccountId accountId) override {
        try {
            auto lease = pool_->acquire();
            pqxx::work txn(*lease);

            auto account = txn.exec_params("SELECT 1 FROM users WHERE id = $1", accountId);
            if (account.empty()) {
                txn.commit();
                return std::nullopt;
            }

            auto result = txn.exec_params(
                "SELECT id, user_id, amount FROM transactions WHERE user_id = $1 ORDER BY id",
                accountId
            );
            txn.commit();

            std::vector<domain::LedgerEntry> entries;
            entries.reserve(result.size());
            for (const auto& row : result) {
                entries.emplace_back(
                    row["id"].as<std::int64_t>(),
                    row["user_id"].as<domain::AccountId>(),
                    row["amount"].as<std::int64_t>()
                );
            }
            return entries;

        } catch (const StorageException&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresLedgerStore] findEntries() failed: " << e.what() << std::endl;
            throw StorageException(e.what());
        }
    }

    std::unique_ptr<ports::output::ILedgerUnitOfWork> begin() override {
        return std::make_unique<UnitOfWork>(pool_->acquire());
    }

private:
    std::shared_ptr<PgConnectionPool> pool_;
};

} // namespace atm::adapters::secondary
