#include <gtest/gtest.h>

#include "application/SessionManager.hpp"
#include "mocks/FakeClock.hpp"

#include <thread>
#include <vector>
#include <set>
#include <mutex>
#include <atomic>
#include <cstdlib>

using namespace atm;
using namespace atm::tests::mocks;
using ports::input::SessionStatus;
using std::chrono::seconds;

// ============================================
// TEST FIXTURE
// ============================================

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::SessionSettings>();
        clock_ = std::make_shared<FakeClock>();
        store_ = std::make_shared<application::SessionStore>();
        manager_ = std::make_shared<application::SessionManager>(settings_, clock_, store_);
    }

    std::shared_ptr<settings::SessionSettings> settings_;
    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<application::SessionStore> store_;
    std::shared_ptr<application::SessionManager> manager_;
};

// ============================================
// CREATE
// ============================================

TEST_F(SessionManagerTest, CreateSession_ExpiresAfterTtl) {
    auto start = clock_->now();
    auto session = manager_->createSession(7);

    EXPECT_TRUE(utils::UuidGenerator::isValid(session.sessionId));
    EXPECT_EQ(session.accountId, 7);
    EXPECT_EQ(session.createdAt, start);
    EXPECT_EQ(session.expiresAt, start + seconds(600));
    EXPECT_EQ(manager_->sessionCount(), 1u);
}

TEST_F(SessionManagerTest, CreateSession_SameAccountGetsDistinctSessions) {
    auto first = manager_->createSession(1);
    auto second = manager_->createSession(1);

    EXPECT_NE(first.sessionId, second.sessionId);
    EXPECT_TRUE(manager_->validate(first.sessionId).valid());
    EXPECT_TRUE(manager_->validate(second.sessionId).valid());
}

// ============================================
// VALIDATE
// ============================================

TEST_F(SessionManagerTest, Validate_UnknownSession) {
    auto result = manager_->validate(utils::UuidGenerator::generate());

    EXPECT_EQ(result.status, SessionStatus::NOT_FOUND);
    EXPECT_FALSE(result.valid());
    EXPECT_FALSE(result.renewed);
}

TEST_F(SessionManagerTest, Validate_FreshSessionNotRenewed) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(10));

    auto result = manager_->validate(session.sessionId);

    ASSERT_TRUE(result.valid());
    EXPECT_FALSE(result.renewed);
    EXPECT_EQ(result.session.accountId, 1);
    EXPECT_EQ(result.session.expiresAt, session.expiresAt);
}

TEST_F(SessionManagerTest, Validate_OneSecondBeforeExpiryIsValidAndRenewed) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(599));

    auto result = manager_->validate(session.sessionId);

    ASSERT_TRUE(result.valid());
    EXPECT_TRUE(result.renewed);
    EXPECT_EQ(result.session.expiresAt, clock_->now() + seconds(600));
}

TEST_F(SessionManagerTest, Validate_ExpiredAtExactTtl) {
    auto session = manager_->createSession(3);
    clock_->advance(seconds(600));

    auto result = manager_->validate(session.sessionId);

    EXPECT_EQ(result.status, SessionStatus::EXPIRED);
    EXPECT_FALSE(result.renewed);
    EXPECT_EQ(result.session.accountId, 3);
    // Истёкшая сессия остаётся до чистки и продолжает отвечать EXPIRED
    EXPECT_EQ(manager_->sessionCount(), 1u);
    EXPECT_EQ(manager_->validate(session.sessionId).status, SessionStatus::EXPIRED);
}

TEST_F(SessionManagerTest, Validate_RemainingEqualToThresholdNotRenewed) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(540));

    auto result = manager_->validate(session.sessionId);

    ASSERT_TRUE(result.valid());
    EXPECT_FALSE(result.renewed);
    EXPECT_EQ(result.session.expiresAt, session.expiresAt);
}

TEST_F(SessionManagerTest, Validate_BelowThresholdRenewsToFullTtl) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(541));

    auto result = manager_->validate(session.sessionId);

    ASSERT_TRUE(result.valid());
    EXPECT_TRUE(result.renewed);
    EXPECT_EQ(result.session.expiresAt, clock_->now() + seconds(600));

    // Продлённая сессия переживает исходный срок
    clock_->advance(seconds(100));
    EXPECT_TRUE(manager_->validate(session.sessionId).valid());
}

TEST_F(SessionManagerTest, Validate_UnusedSessionExpiresWithoutRenewal) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(300));
    ASSERT_TRUE(manager_->validate(session.sessionId).valid());

    clock_->advance(seconds(300));
    EXPECT_EQ(manager_->validate(session.sessionId).status, SessionStatus::EXPIRED);
}

// ============================================
// RENEW
// ============================================

TEST_F(SessionManagerTest, Renew_ExtendsFromNow) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(100));

    auto renewed = manager_->renew(session.sessionId);

    ASSERT_TRUE(renewed.has_value());
    EXPECT_EQ(renewed->sessionId, session.sessionId);
    EXPECT_EQ(renewed->accountId, session.accountId);
    EXPECT_EQ(renewed->createdAt, session.createdAt);
    EXPECT_EQ(renewed->expiresAt, clock_->now() + seconds(600));
}

TEST_F(SessionManagerTest, Renew_ExpiredSessionNotRevived) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(900));
    ASSERT_EQ(manager_->validate(session.sessionId).status, SessionStatus::EXPIRED);

    EXPECT_FALSE(manager_->renew(session.sessionId).has_value());

    auto result = manager_->validate(session.sessionId);
    EXPECT_EQ(result.status, SessionStatus::EXPIRED);
    EXPECT_EQ(result.session.expiresAt, session.expiresAt);
}

TEST_F(SessionManagerTest, Renew_AtExactExpiryRefused) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(600));

    EXPECT_FALSE(manager_->renew(session.sessionId).has_value());
    EXPECT_EQ(manager_->validate(session.sessionId).status, SessionStatus::EXPIRED);
}

TEST_F(SessionManagerTest, Renew_OneSecondBeforeExpiryExtends) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(599));

    auto renewed = manager_->renew(session.sessionId);

    ASSERT_TRUE(renewed.has_value());
    EXPECT_EQ(renewed->expiresAt, clock_->now() + seconds(600));
}

TEST_F(SessionManagerTest, Renew_UnknownSession) {
    EXPECT_FALSE(manager_->renew(utils::UuidGenerator::generate()).has_value());
}

// ============================================
// PURGE
// ============================================

TEST_F(SessionManagerTest, PurgeExpired_RemovesOnlyExpired) {
    auto old = manager_->createSession(1);
    clock_->advance(seconds(400));
    auto young = manager_->createSession(2);
    clock_->advance(seconds(200));

    EXPECT_EQ(manager_->purgeExpired(), 1u);
    EXPECT_EQ(manager_->sessionCount(), 1u);
    EXPECT_EQ(manager_->validate(old.sessionId).status, SessionStatus::NOT_FOUND);
    EXPECT_TRUE(manager_->validate(young.sessionId).valid());
}

TEST_F(SessionManagerTest, CreateSession_SweepsEveryNthCreation) {
    setenv("ATM_SESSION_SWEEP_INTERVAL", "2", 1);
    auto settings = std::make_shared<settings::SessionSettings>();
    unsetenv("ATM_SESSION_SWEEP_INTERVAL");

    application::SessionManager manager(settings, clock_, store_);

    manager.createSession(1);
    clock_->advance(seconds(600));
    EXPECT_EQ(manager.sessionCount(), 1u);

    // Второе создание запускает чистку до вставки
    manager.createSession(2);
    EXPECT_EQ(manager.sessionCount(), 1u);
}

TEST(SessionSettingsTest, RejectsThresholdAboveTtl) {
    setenv("ATM_SESSION_TTL_SECONDS", "30", 1);
    EXPECT_THROW(settings::SessionSettings(), std::runtime_error);
    unsetenv("ATM_SESSION_TTL_SECONDS");
}

// ============================================
// CONCURRENCY
// ============================================

TEST_F(SessionManagerTest, Concurrent_CreateYieldsUniqueIds) {
    const int THREADS = 8;
    const int PER_THREAD = 250;

    std::mutex idsMutex;
    std::set<std::string> ids;
    std::vector<std::thread> threads;

    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&, t]() {
            std::vector<std::string> local;
            for (int i = 0; i < PER_THREAD; ++i) {
                local.push_back(manager_->createSession(t).sessionId);
            }
            std::lock_guard<std::mutex> lock(idsMutex);
            ids.insert(local.begin(), local.end());
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(ids.size(), static_cast<std::size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(manager_->sessionCount(), static_cast<std::size_t>(THREADS * PER_THREAD));
}

TEST_F(SessionManagerTest, Concurrent_ExpiredSessionNeverRevived) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(600));

    std::atomic<int> valid(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 200; ++i) {
                if (manager_->validate(session.sessionId).valid()) {
                    valid++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(valid.load(), 0);
    EXPECT_EQ(manager_->validate(session.sessionId).status, SessionStatus::EXPIRED);
}

TEST_F(SessionManagerTest, Concurrent_ValidateNearThresholdKeepsSessionAlive) {
    auto session = manager_->createSession(1);
    clock_->advance(seconds(590));

    std::atomic<int> renewed(0);
    std::atomic<int> valid(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                auto result = manager_->validate(session.sessionId);
                if (result.valid()) valid++;
                if (result.renewed) renewed++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(valid.load(), 800);
    // Часы стоят: продлевает только первая проверка
    EXPECT_EQ(renewed.load(), 1);
}

TEST_F(SessionManagerTest, Concurrent_RenewRacingValidateAcrossExpiry) {
    auto session = manager_->createSession(1);

    std::atomic<bool> expiredSeen(false);
    std::atomic<int> operations(0);
    std::atomic<int> revived(0);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                // seenBefore: EXPIRED наблюдался до начала этого вызова
                bool seenBefore = expiredSeen.load();
                auto result = manager_->validate(session.sessionId);
                if (result.status == SessionStatus::EXPIRED) expiredSeen = true;
                if (seenBefore && result.valid()) revived++;
                operations++;
            }
        });
        threads.emplace_back([&]() {
            for (int i = 0; i < 1000; ++i) {
                bool seenBefore = expiredSeen.load();
                auto renewed = manager_->renew(session.sessionId);
                if (seenBefore && renewed.has_value()) revived++;
                operations++;
            }
        });
    }

    // Скачок часов дальше TTL посреди гонки
    threads.emplace_back([&]() {
        while (operations.load() < 2000) {
            std::this_thread::yield();
        }
        clock_->advance(seconds(700));
    });

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(revived.load(), 0);
    EXPECT_FALSE(manager_->renew(session.sessionId).has_value());
    EXPECT_EQ(manager_->validate(session.sessionId).status, SessionStatus::EXPIRED);
}
