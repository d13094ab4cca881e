#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "application/JsonRecordCodec.hpp"
#include "ports/input/ILedgerService.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief account add --name <имя> [--balance <начальный баланс>]
 */
class AddAccountHandler : public ICommandHandler {
public:
    explicit AddAccountHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        auto account = ledger_->addAccount(args.getOr("name", ""), args.getIntOr("balance", 0));
        response = application::JsonRecordCodec::toJson(account);
    }

    std::string description() const override {
        return "account add --name NAME [--balance N]: create an account";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
