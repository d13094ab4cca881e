#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief tx delete --id <id> - удаляет транзакцию и откатывает баланс
 */
class DeleteTransactionHandler : public ICommandHandler {
public:
    explicit DeleteTransactionHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        const std::string id = args.get("id");
        response["id"] = id;
        response["deleted"] = ledger_->deleteTransaction(id);
    }

    std::string description() const override {
        return "tx delete --id ID: delete a transaction and revert its balance change";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
