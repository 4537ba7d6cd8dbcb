#pragma once

#include "ports/input/ISessionManager.hpp"
#include "ports/output/IClock.hpp"
#include "settings/SessionSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <ThreadSafeMap.hpp>
#include <memory>
#include <atomic>
#include <cstdint>
#include <iostream>

namespace atm::application {

/// Хранилище сессий: sessionId -> Session
using SessionStore = ThreadSafeMap<std::string, domain::Session>;

/**
 * @brief Менеджер сессий
 *
 * Все сессии лежат во внедрённом SessionStore под одним shared_mutex.
 * Проверка срока и продление в validate() выполняются в одной
 * критической секции SessionStore::update() с одним значением now,
 * поэтому конкурирующее продление не может оживить истёкшую сессию.
 * Один мьютекс на всё хранилище: все записи сессий сериализуются.
 */
class SessionManager : public ports::input::ISessionManager {
public:
    SessionManager(
        std::shared_ptr<settings::SessionSettings> settings,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<SessionStore> store
    ) : settings_(std::move(settings))
      , clock_(std::move(clock))
      , store_(std::move(store))
    {
        std::cout << "[SessionManager] Created (ttl=" << settings_->getTtl().count()
                  << "s, renew<" << settings_->getRenewThreshold().count() << "s)" << std::endl;
    }

    domain::Session createSession(domain::AccountId accountId) override {
        sweepIfDue();

        domain::Session session(
            utils::UuidGenerator::generate(),
            accountId,
            clock_->now(),
            settings_->getTtl()
        );
        store_->insert(session.sessionId, std::make_shared<domain::Session>(session));

        std::cout << "[SessionManager] Session created for account " << accountId << std::endl;
        return session;
    }

    ports::input::ValidateResult validate(const std::string& sessionId) override {
        ports::input::ValidateResult result;

        bool found = store_->update(sessionId, [this, &result](domain::Session& session) {
            auto now = clock_->now();

            if (session.isExpired(now)) {
                result.status = ports::input::SessionStatus::EXPIRED;
                result.session = session;
                result.message = "Session expired";
                return;
            }

            if (session.remaining(now) < settings_->getRenewThreshold()) {
                session.renew(now, settings_->getTtl());
                result.renewed = true;
            }

            result.status = ports::input::SessionStatus::VALID;
            result.session = session;
            result.message = "Valid";
        });

        if (!found) {
            result.status = ports::input::SessionStatus::NOT_FOUND;
            result.message = "Session not found";
        }
        return result;
    }

    std::optional<domain::Session> renew(const std::string& sessionId) override {
        std::optional<domain::Session> renewed;

        store_->update(sessionId, [this, &renewed](domain::Session& session) {
            auto now = clock_->now();
            if (session.isExpired(now)) {
                return;
            }
            session.renew(now, settings_->getTtl());
            renewed = session;
        });

        if (!renewed) {
            std::cout << "[SessionManager] Renew refused: session missing or expired" << std::endl;
        }

        return renewed;
    }

    std::size_t purgeExpired() override {
        auto now = clock_->now();
        auto removed = store_->removeIf([now](const domain::Session& session) {
            return session.isExpired(now);
        });

        if (removed > 0) {
            std::cout << "[SessionManager] Purged " << removed << " expired sessions" << std::endl;
        }
        return removed;
    }

    std::size_t sessionCount() const override {
        return store_->size();
    }

private:
    std::shared_ptr<settings::SessionSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<SessionStore> store_;
    std::atomic<std::uint64_t> created_{0};

    void sweepIfDue() {
        int interval = settings_->getSweepInterval();
        if (interval <= 0) return;

        if (++created_ % static_cast<std::uint64_t>(interval) == 0) {
            purgeExpired();
        }
    }
};

} // namespace atm::application
