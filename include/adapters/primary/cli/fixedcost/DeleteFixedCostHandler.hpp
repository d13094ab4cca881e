#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

class DeleteFixedCostHandler : public ICommandHandler {
public:
    explicit DeleteFixedCostHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        const std::string id = args.get("id");
        response["id"] = id;
        response["deleted"] = ledger_->deleteTemplate(id);
    }

    std::string description() const override {
        return "fixed delete --id ID: delete a fixed cost template";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
