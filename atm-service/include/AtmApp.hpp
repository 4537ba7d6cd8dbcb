#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/SessionSettings.hpp"
#include "settings/LedgerSettings.hpp"

// Ports
#include "ports/input/ISessionManager.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/ILedgerStore.hpp"

// Application
#include "application/SessionManager.hpp"
#include "application/LedgerService.hpp"

// Secondary Adapters
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/PgConnectionPool.hpp"
#include "adapters/secondary/PostgresLedgerStore.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/SessionAuthMiddleware.hpp"
#include "adapters/primary/LoginHandler.hpp"
#include "adapters/primary/GetBalanceHandler.hpp"
#include "adapters/primary/TransactionHandler.hpp"
#include "adapters/primary/GetTransactionsHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace atm {

/**
 * @brief ATM Service Application
 *
 * Без сессии: POST /api/v1/login, GET /health
 * С сессией (SessionAuthMiddleware в ChainHandler):
 *   GET /api/v1/balance, POST /api/v1/deposit, POST /api/v1/withdraw,
 *   GET /api/v1/transactions
 */
class AtmApp : public BoostBeastApplication {
public:
    AtmApp() { std::cout << "[AtmApp] Initializing..." << std::endl; }
    ~AtmApp() override { std::cout << "[AtmApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[AtmApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[AtmApp] Configuring DI..." << std::endl;

        // Шаг 1: хранилище книги счетов выбирается по ATM_STORAGE
        auto ledgerSettings = std::make_shared<settings::LedgerSettings>();
        auto ledgerStore = createLedgerStore(*ledgerSettings);

        // Шаг 2: сервисы
        auto injector = di::make_injector(
            di::bind<settings::SessionSettings>().in(di::singleton),
            di::bind<settings::LedgerSettings>().to(ledgerSettings),

            di::bind<application::SessionStore>().in(di::singleton),
            di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),
            di::bind<ports::output::ILedgerStore>().to(ledgerStore),

            di::bind<ports::input::ISessionManager>().to<application::SessionManager>().in(di::singleton),
            di::bind<ports::input::ILedgerService>().to<application::LedgerService>().in(di::singleton));

        // Шаг 3: HTTP Handlers
        handlers_[getHandlerKey("GET", "/health")] =
            injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

        handlers_[getHandlerKey("POST", "/api/v1/login")] =
            injector.create<std::shared_ptr<adapters::primary::LoginHandler>>();

        auto auth = injector.create<std::shared_ptr<adapters::primary::SessionAuthMiddleware>>();
        auto ledgerService = injector.create<std::shared_ptr<ports::input::ILedgerService>>();

        handlers_[getHandlerKey("GET", "/api/v1/balance")] = std::make_shared<adapters::primary::ChainHandler>(
            auth, injector.create<std::shared_ptr<adapters::primary::GetBalanceHandler>>());

        handlers_[getHandlerKey("POST", "/api/v1/deposit")] = std::make_shared<adapters::primary::ChainHandler>(
            auth, std::make_shared<adapters::primary::TransactionHandler>(ledgerService, domain::TransactionKind::DEPOSIT));

        handlers_[getHandlerKey("POST", "/api/v1/withdraw")] = std::make_shared<adapters::primary::ChainHandler>(
            auth, std::make_shared<adapters::primary::TransactionHandler>(ledgerService, domain::TransactionKind::WITHDRAWAL));

        handlers_[getHandlerKey("GET", "/api/v1/transactions")] = std::make_shared<adapters::primary::ChainHandler>(
            auth, injector.create<std::shared_ptr<adapters::primary::GetTransactionsHandler>>());

        std::cout << "[AtmApp] Ready (storage: " << ledgerSettings->getStorage() << ")" << std::endl;
    }

private:
    static std::shared_ptr<ports::output::ILedgerStore> createLedgerStore(const settings::LedgerSettings& settings) {
        if (settings.isInMemory()) {
            auto store = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
            for (const auto& seed : settings.getSeedAccounts()) {
                auto accountId = store->provision(seed.pin, seed.balance);
                std::cout << "[AtmApp] Seeded account " << accountId
                          << " with balance " << seed.balance << std::endl;
            }
            return store;
        }

        auto pgInjector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<adapters::secondary::PgConnectionPool>().in(di::singleton));
        return pgInjector.create<std::shared_ptr<adapters::secondary::PostgresLedgerStore>>();
    }
};

} // namespace atm
