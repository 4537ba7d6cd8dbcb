#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace atm::settings {

/**
 * @brief Настройки книги счетов из ENV
 *
 * ATM_STORAGE          - postgres | memory
 * ATM_ALLOW_OVERDRAFT  - разрешить отрицательный баланс (false)
 * ATM_SEED_ACCOUNTS    - "pin:balance,pin:balance" для memory
 */
class LedgerSettings {
public:
    struct SeedAccount {
        std::string pin;
        std::int64_t balance;
    };

    LedgerSettings() {
        storage_ = getEnvOrDefault("ATM_STORAGE", "postgres");
        if (storage_ != "postgres" && storage_ != "memory") {
            throw std::runtime_error("ATM_STORAGE must be 'postgres' or 'memory', got: " + storage_);
        }
        allowOverdraft_ = parseBool(getEnvOrDefault("ATM_ALLOW_OVERDRAFT", "false"));
        seedAccounts_ = parseSeed(getEnvOrDefault("ATM_SEED_ACCOUNTS", ""));
    }

    std::string getStorage() const { return storage_; }
    bool isInMemory() const { return storage_ == "memory"; }
    bool isOverdraftAllowed() const { return allowOverdraft_; }
    const std::vector<SeedAccount>& getSeedAccounts() const { return seedAccounts_; }

    void setOverdraftAllowed(bool allowed) { allowOverdraft_ = allowed; }

private:
    std::string storage_;
    bool allowOverdraft_;
    std::vector<SeedAccount> seedAccounts_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static bool parseBool(const std::string& value) {
        if (value == "true" || value == "1" || value == "yes") return true;
        if (value == "false" || value == "0" || value == "no") return false;
        throw std::runtime_error("Invalid boolean value: " + value);
    }

    static std::vector<SeedAccount> parseSeed(const std::string& value) {
        std::vector<SeedAccount> result;
        std::istringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (item.empty()) continue;
            auto colon = item.find(':');
            if (colon == std::string::npos || colon == 0) {
                throw std::runtime_error("Invalid ATM_SEED_ACCOUNTS entry: " + item);
            }
            try {
                result.push_back({item.substr(0, colon), std::stoll(item.substr(colon + 1))});
            } catch (const std::logic_error&) {
                throw std::runtime_error("Invalid balance in ATM_SEED_ACCOUNTS entry: " + item);
            }
        }
        return result;
    }
};

} // namespace atm::settings
