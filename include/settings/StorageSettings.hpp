#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки хранилища из ENV
 *
 * LEDGER_STORAGE             file | postgres (default: file)
 * LEDGER_DATA_DIR            каталог JSON-файлов (default: ./data)
 * LEDGER_SAVE_MAX_ATTEMPTS   попыток на load/save (default: 3)
 * LEDGER_SAVE_RETRY_DELAY_MS пауза между попытками (default: 50)
 */
class StorageSettings {
public:
    enum class Backend { FILE, POSTGRES };

    StorageSettings() {
        std::string backend = getEnvOrDefault("LEDGER_STORAGE", "file");
        if (backend == "file") {
            backend_ = Backend::FILE;
        } else if (backend == "postgres") {
            backend_ = Backend::POSTGRES;
        } else {
            throw std::invalid_argument("Unknown LEDGER_STORAGE: " + backend);
        }

        dataDir_ = getEnvOrDefault("LEDGER_DATA_DIR", "./data");
        maxAttempts_ = getIntEnvOrDefault("LEDGER_SAVE_MAX_ATTEMPTS", "3");
        retryDelayMs_ = getIntEnvOrDefault("LEDGER_SAVE_RETRY_DELAY_MS", "50");

        if (maxAttempts_ < 1) {
            throw std::invalid_argument("LEDGER_SAVE_MAX_ATTEMPTS must be >= 1");
        }
        if (retryDelayMs_ < 0) {
            throw std::invalid_argument("LEDGER_SAVE_RETRY_DELAY_MS must be >= 0");
        }
    }

    Backend getBackend() const { return backend_; }
    std::string getDataDir() const { return dataDir_; }
    int getMaxAttempts() const { return maxAttempts_; }
    int getRetryDelayMs() const { return retryDelayMs_; }

private:
    Backend backend_;
    std::string dataDir_;
    int maxAttempts_;
    int retryDelayMs_;

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
};

} // namespace ledger::settings
