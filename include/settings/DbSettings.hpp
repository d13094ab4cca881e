#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace ledger::settings {

/**
 * @brief Настройки подключения к БД из ENV
 *
 * Читаются только при LEDGER_STORAGE=postgres.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("LEDGER_DB_HOST", "localhost");
        port_ = getIntEnvOrDefault("LEDGER_DB_PORT", "5432");
        name_ = getEnvOrDefault("LEDGER_DB_NAME", "ledger_db");
        user_ = getEnvOrDefault("LEDGER_DB_USER", "ledger_user");
        password_ = getEnvOrThrow("LEDGER_DB_PASSWORD");
        connectTimeoutSeconds_ = getIntEnvOrDefault("LEDGER_DB_CONNECT_TIMEOUT", "5");
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    int getConnectTimeoutSeconds() const { return connectTimeoutSeconds_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=" + std::to_string(connectTimeoutSeconds_);
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    int connectTimeoutSeconds_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static int getIntEnvOrDefault(const char* name, const std::string& defaultValue) {
        const std::string value = getEnvOrDefault(name, defaultValue);
        try {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed == value.size()) {
                return parsed;
            }
        } catch (const std::logic_error&) {
            // std::invalid_argument / std::out_of_range
        }
        throw std::invalid_argument(std::string(name) + " must be an integer, got '" + value + "'");
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace ledger::settings
