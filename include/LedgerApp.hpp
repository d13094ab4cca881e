#pragma once

#include "adapters/primary/cli/LedgerCli.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ledger::settings {
    class StorageSettings;
}

namespace ledger::ports::output {
    class IDocumentStore;
}

namespace ledger {

/**
 * @class LedgerApp
 * @brief Приложение "家計簿" - учёт балансов счетов и фиксированных платежей
 *
 * Template Method:
 * 1. loadEnvironment()    - настройки хранилища из ENV
 * 2. configureInjection() - Boost.DI: адаптеры → сервисы → CLI handlers
 * 3. start()              - выполнить одну команду CLI
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: CLI handlers
 * - Secondary Adapters: JsonFileDocumentStore / PostgresDocumentStore
 *   (за RetryingDocumentStore), SystemClock
 */
class LedgerApp {
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @return Код возврата процесса
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    int start();

private:
    std::shared_ptr<settings::StorageSettings> storageSettings_;
    adapters::primary::cli::LedgerCli cli_;
    std::vector<std::string> tokens_;

    std::shared_ptr<ports::output::IDocumentStore> createDocumentStore() const;
};

} // namespace ledger
