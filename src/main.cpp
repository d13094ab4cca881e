#include "LedgerApp.hpp"
#include "domain/errors/PersistenceError.hpp"
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

int main(int argc, char* argv[])
{
    try
    {
        ledger::LedgerApp app;
        return app.run(argc, argv);
    }
    catch (const ledger::domain::PersistenceError& e)
    {
        std::cerr << "[main] Storage unavailable: " << e.what() << std::endl;
        std::cout << nlohmann::json{{"error", e.what()}}.dump(2) << std::endl;
        return ledger::adapters::primary::cli::LedgerCli::EXIT_PERSISTENCE;
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "[main] Invalid configuration: " << e.what() << std::endl;
        std::cout << nlohmann::json{{"error", e.what()}}.dump(2) << std::endl;
        return ledger::adapters::primary::cli::LedgerCli::EXIT_USAGE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        std::cout << nlohmann::json{{"error", e.what()}}.dump(2) << std::endl;
        return ledger::adapters::primary::cli::LedgerCli::EXIT_INTERNAL;
    }
}
