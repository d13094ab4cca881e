#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief account delete --id <id>
 *
 * Транзакции счёта остаются как есть.
 */
class DeleteAccountHandler : public ICommandHandler {
public:
    explicit DeleteAccountHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        const std::string id = args.get("id");
        response["id"] = id;
        response["deleted"] = ledger_->deleteAccount(id);
    }

    std::string description() const override {
        return "account delete --id ID: delete an account, its transactions are kept";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
