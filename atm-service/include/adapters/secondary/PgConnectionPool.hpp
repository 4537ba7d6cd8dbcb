#pragma once

#include "settings/DbSettings.hpp"
#include <StorageException.hpp>
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <vector>
#include <iostream>

namespace atm::adapters::secondary {

/**
 * @brief Пул соединений PostgreSQL
 *
 * Каждая единица работы арендует своё соединение, поэтому транзакции по
 * разным счетам идут параллельно. acquire() блокируется только когда все
 * poolSize соединений арендованы. Оборванное соединение не возвращается
 * в пул, на его месте лениво открывается новое.
 */
class PgConnectionPool {
public:
    /**
     * @brief Аренда соединения, возвращается в пул в деструкторе
     */
    class Lease {
    public:
        Lease(PgConnectionPool& pool, std::unique_ptr<pqxx::connection> connection)
            : pool_(&pool)
            , connection_(std::move(connection))
        {}

        Lease(Lease&& other) noexcept
            : pool_(other.pool_)
            , connection_(std::move(other.connection_))
        {}

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        ~Lease() {
            if (connection_) {
                pool_->release(std::move(connection_));
            }
        }

        pqxx::connection& operator*() { return *connection_; }
        pqxx::connection* operator->() { return connection_.get(); }

    private:
        PgConnectionPool* pool_;
        std::unique_ptr<pqxx::connection> connection_;
    };

    explicit PgConnectionPool(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
        , maxSize_(static_cast<std::size_t>(settings_->getPoolSize()))
    {
        std::cout << "[PgConnectionPool] Connecting to " << settings_->getHost()
                  << ":" << settings_->getPort() << "/" << settings_->getName() << "..." << std::endl;

        // Первое соединение открывается при старте
        std::lock_guard<std::mutex> lock(mutex_);
        idle_.push_back(open());
        ++opened_;
        std::cout << "[PgConnectionPool] Connected (pool size " << maxSize_ << ")" << std::endl;
    }

    ~PgConnectionPool() {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& connection : idle_) {
            if (connection && connection->is_open()) {
                connection->close();
            }
        }
    }

    /**
     * @throws StorageException если новое соединение открыть не удалось
     */
    Lease acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        available_.wait(lock, [this]() { return !idle_.empty() || opened_ < maxSize_; });

        if (!idle_.empty()) {
            auto connection = std::move(idle_.back());
            idle_.pop_back();
            return Lease(*this, std::move(connection));
        }

        // Слот занят до открытия: opened_ <= maxSize_
        ++opened_;
        lock.unlock();
        try {
            return Lease(*this, open());
        } catch (const StorageException&) {
            lock.lock();
            --opened_;
            available_.notify_one();
            throw;
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::size_t maxSize_;
    std::size_t opened_ = 0;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
    std::mutex mutex_;
    std::condition_variable available_;

    std::unique_ptr<pqxx::connection> open() {
        try {
            return std::make_unique<pqxx::connection>(settings_->getConnectionString());
        } catch (const std::exception& e) {
            std::cerr << "[PgConnectionPool] Connection failed: " << e.what() << std::endl;
            throw StorageException(std::string("Cannot connect to database: ") + e.what());
        }
    }

    void release(std::unique_ptr<pqxx::connection> connection) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connection->is_open()) {
                idle_.push_back(std::move(connection));
            } else {
                std::cerr << "[PgConnectionPool] Dropping broken connection" << std::endl;
                --opened_;
            }
        }
        available_.notify_one();
    }
};

} // namespace atm::adapters::secondary
