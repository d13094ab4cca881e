#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "application/JsonRecordCodec.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

class ListFixedCostsHandler : public ICommandHandler {
public:
    explicit ListFixedCostsHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& /*args*/, nlohmann::json& response) override {
        response["fixed_costs"] = application::JsonRecordCodec::toJsonArray(ledger_->templates());
    }

    std::string description() const override {
        return "fixed list: show fixed cost templates";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
