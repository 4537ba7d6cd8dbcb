#pragma once

#include <gmock/gmock.h>
#include "ports/output/ILedgerStore.hpp"

namespace atm::tests::mocks {

class MockLedgerUnitOfWork : public ports::output::ILedgerUnitOfWork {
public:
    MOCK_METHOD(std::optional<std::int64_t>, lockBalance, (domain::AccountId), (override));
    MOCK_METHOD(void, writeBalance, (domain::AccountId, std::int64_t), (override));
    MOCK_METHOD(void, appendEntry, (domain::AccountId, std::int64_t), (override));
    MOCK_METHOD(void, commit, (), (override));
    MOCK_METHOD(void, rollback, (), (override));
};

class MockLedgerStore : public ports::output::ILedgerStore {
public:
    MOCK_METHOD(std::optional<domain::AccountId>, findAccountByPin, (const std::string&), (override));
    MOCK_METHOD(std::optional<std::int64_t>, findBalance, (domain::AccountId), (override));
    MOCK_METHOD(std::optional<std::vector<domain::LedgerEntry>>, findEntries, (domain::AccountId), (override));
    MOCK_METHOD(std::unique_ptr<ports::output::ILedgerUnitOfWork>, begin, (), (override));
};

} // namespace atm::tests::mocks
