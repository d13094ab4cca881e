#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "adapters/primary/cli/DateOption.hpp"
#include "application/JsonRecordCodec.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief tx add --account <имя> --amount <N> [--date YYYY-MM-DD] [--memo <текст>]
 *
 * Расход - отрицательная сумма. Счёт может не существовать:
 * транзакция запишется, баланс не изменится.
 */
class AddTransactionHandler : public ICommandHandler {
public:
    AddTransactionHandler(
        std::shared_ptr<ports::input::ILedgerService> ledger,
        std::shared_ptr<ports::output::IClock> clock
    ) : ledger_(std::move(ledger))
      , clock_(std::move(clock)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        auto tx = ledger_->addTransaction(
            dateOptionOrToday(args, *clock_),
            args.get("account"),
            args.getInt("amount"),
            args.getOr("memo", "")
        );
        response = application::JsonRecordCodec::toJson(tx);
    }

    std::string description() const override {
        return "tx add --account NAME --amount N [--date YYYY-MM-DD] [--memo TEXT]: record income (+) or expense (-)";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace ledger::adapters::primary::cli
