#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "application/JsonRecordCodec.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

class ListAccountsHandler : public ICommandHandler {
public:
    explicit ListAccountsHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& /*args*/, nlohmann::json& response) override {
        response["accounts"] = application::JsonRecordCodec::toJsonArray(ledger_->accounts());
    }

    std::string description() const override {
        return "account list: show accounts with balances";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
