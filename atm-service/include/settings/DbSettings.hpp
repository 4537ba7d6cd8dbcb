#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace atm::settings {

/**
 * @brief Настройки подключения к PostgreSQL из ENV
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("ATM_DB_HOST", "localhost");
        port_ = std::stoi(getEnvOrDefault("ATM_DB_PORT", "5432"));
        name_ = getEnvOrDefault("ATM_DB_NAME", "atm_db");
        user_ = getEnvOrDefault("ATM_DB_USER", "atm_user");
        password_ = getEnvOrDefault("ATM_DB_PASSWORD", "");
        poolSize_ = std::stoi(getEnvOrDefault("ATM_DB_POOL_SIZE", "8"));
        if (poolSize_ <= 0) {
            throw std::runtime_error("ATM_DB_POOL_SIZE must be positive");
        }
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    int getPoolSize() const { return poolSize_; }

    /**
     * @throws std::runtime_error если ATM_DB_PASSWORD не задан
     */
    std::string getConnectionString() const {
        if (password_.empty()) {
            throw std::runtime_error("Required env variable not set: ATM_DB_PASSWORD");
        }
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int poolSize_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace atm::settings
