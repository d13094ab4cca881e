#include "LedgerApp.hpp"

#include <boost/di.hpp>

// Settings
#include "settings/StorageSettings.hpp"
#include "settings/DbSettings.hpp"

// Ports
#include "ports/input/ILedgerService.hpp"
#include "ports/input/IRecurringChargeService.hpp"
#include "ports/input/IReportService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IDocumentStore.hpp"

// Application Services
#include "application/LedgerStore.hpp"
#include "application/RecurringChargeService.hpp"
#include "application/ReportService.hpp"

// Secondary Adapters
#include "adapters/secondary/clock/SystemClock.hpp"
#include "adapters/secondary/persistence/JsonFileDocumentStore.hpp"
#include "adapters/secondary/persistence/PostgresDocumentStore.hpp"
#include "adapters/secondary/persistence/RetryingDocumentStore.hpp"

// Primary Adapters (CLI handlers)
#include "adapters/primary/cli/account/AddAccountHandler.hpp"
#include "adapters/primary/cli/account/DeleteAccountHandler.hpp"
#include "adapters/primary/cli/account/ListAccountsHandler.hpp"
#include "adapters/primary/cli/transaction/AddTransactionHandler.hpp"
#include "adapters/primary/cli/transaction/DeleteTransactionHandler.hpp"
#include "adapters/primary/cli/transaction/ListTransactionsHandler.hpp"
#include "adapters/primary/cli/fixedcost/AddFixedCostHandler.hpp"
#include "adapters/primary/cli/fixedcost/DeleteFixedCostHandler.hpp"
#include "adapters/primary/cli/fixedcost/ListFixedCostsHandler.hpp"
#include "adapters/primary/cli/fixedcost/ApplyFixedCostsHandler.hpp"
#include "adapters/primary/cli/SummaryHandler.hpp"

#include <chrono>
#include <iostream>

namespace di = boost::di;

namespace ledger {

using namespace adapters::primary::cli;

LedgerApp::LedgerApp() = default;

LedgerApp::~LedgerApp() = default;

int LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    return start();
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    tokens_.assign(argv + 1, argv + argc);
    storageSettings_ = std::make_shared<settings::StorageSettings>();
    std::clog << "[LedgerApp] Environment loaded: storage="
              << (storageSettings_->getBackend() == settings::StorageSettings::Backend::POSTGRES ? "postgres" : "file")
              << std::endl;
}

std::shared_ptr<ports::output::IDocumentStore> LedgerApp::createDocumentStore() const
{
    std::shared_ptr<ports::output::IDocumentStore> store;
    if (storageSettings_->getBackend() == settings::StorageSettings::Backend::POSTGRES) {
        store = std::make_shared<adapters::secondary::PostgresDocumentStore>(
            std::make_shared<settings::DbSettings>());
    } else {
        store = std::make_shared<adapters::secondary::JsonFileDocumentStore>(
            storageSettings_->getDataDir());
    }

    return std::make_shared<adapters::secondary::RetryingDocumentStore>(
        store,
        storageSettings_->getMaxAttempts(),
        std::chrono::milliseconds(storageSettings_->getRetryDelayMs()));
}

void LedgerApp::configureInjection()
{
    // ========================================================================
    // Layer 1: Secondary Adapters - экземпляры выбираются по настройкам
    // ========================================================================
    std::shared_ptr<ports::output::IClock> clock = std::make_shared<adapters::secondary::SystemClock>();
    auto documentStore = createDocumentStore();

    // LedgerStore нужен и как ILedgerService, и как конкретный тип
    // (RecurringChargeService коммитит через него) - один экземпляр на оба
    auto ledgerStore = std::make_shared<application::LedgerStore>(documentStore, clock);

    // ========================================================================
    // Layer 2: Boost.DI
    // ========================================================================
    auto injector = di::make_injector(
        di::bind<ports::output::IClock>().to(clock),
        di::bind<ports::output::IDocumentStore>().to(documentStore),

        di::bind<application::LedgerStore>().to(ledgerStore),
        di::bind<ports::input::ILedgerService>().to(ledgerStore),

        di::bind<ports::input::IRecurringChargeService>()
            .to<application::RecurringChargeService>()
            .in(di::singleton),

        di::bind<ports::input::IReportService>()
            .to<application::ReportService>()
            .in(di::singleton)
    );

    // ========================================================================
    // Layer 3: Primary Adapters (CLI handlers)
    // ========================================================================
    cli_.registerCommand("account add", injector.create<std::shared_ptr<AddAccountHandler>>());
    cli_.registerCommand("account delete", injector.create<std::shared_ptr<DeleteAccountHandler>>());
    cli_.registerCommand("account list", injector.create<std::shared_ptr<ListAccountsHandler>>());

    cli_.registerCommand("tx add", injector.create<std::shared_ptr<AddTransactionHandler>>());
    cli_.registerCommand("tx delete", injector.create<std::shared_ptr<DeleteTransactionHandler>>());
    cli_.registerCommand("tx list", injector.create<std::shared_ptr<ListTransactionsHandler>>());

    cli_.registerCommand("fixed add", injector.create<std::shared_ptr<AddFixedCostHandler>>());
    cli_.registerCommand("fixed delete", injector.create<std::shared_ptr<DeleteFixedCostHandler>>());
    cli_.registerCommand("fixed list", injector.create<std::shared_ptr<ListFixedCostsHandler>>());
    cli_.registerCommand("fixed apply", injector.create<std::shared_ptr<ApplyFixedCostsHandler>>());

    cli_.registerCommand("summary", injector.create<std::shared_ptr<SummaryHandler>>());

    std::clog << "[LedgerApp] DI configured, 11 commands registered" << std::endl;
}

int LedgerApp::start()
{
    return cli_.run(tokens_, std::cout);
}

} // namespace ledger
