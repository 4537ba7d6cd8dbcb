#pragma once

#include <string>
#include <cstdlib>
#include <chrono>
#include <stdexcept>

namespace atm::settings {

/**
 * @brief Параметры сессий из ENV
 *
 * ATM_SESSION_TTL_SECONDS              - срок жизни (600)
 * ATM_SESSION_RENEW_THRESHOLD_SECONDS  - порог автопродления (60)
 * ATM_SESSION_SWEEP_INTERVAL           - чистка истёкших каждые N созданий (256)
 */
class SessionSettings {
public:
    SessionSettings() {
        ttlSeconds_ = std::stoi(getEnvOrDefault("ATM_SESSION_TTL_SECONDS", "600"));
        renewThresholdSeconds_ = std::stoi(getEnvOrDefault("ATM_SESSION_RENEW_THRESHOLD_SECONDS", "60"));
        sweepInterval_ = std::stoi(getEnvOrDefault("ATM_SESSION_SWEEP_INTERVAL", "256"));

        if (ttlSeconds_ <= 0) {
            throw std::runtime_error("ATM_SESSION_TTL_SECONDS must be positive");
        }
        if (renewThresholdSeconds_ < 0 || renewThresholdSeconds_ > ttlSeconds_) {
            throw std::runtime_error("ATM_SESSION_RENEW_THRESHOLD_SECONDS must be within [0, TTL]");
        }
    }

    std::chrono::seconds getTtl() const { return std::chrono::seconds(ttlSeconds_); }
    std::chrono::seconds getRenewThreshold() const { return std::chrono::seconds(renewThresholdSeconds_); }

    /// 0 отключает фоновую чистку при создании сессий
    int getSweepInterval() const { return sweepInterval_; }

private:
    int ttlSeconds_;
    int renewThresholdSeconds_;
    int sweepInterval_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace atm::settings
