#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "application/JsonRecordCodec.hpp"
#include "ports/input/ILedgerService.hpp"
#include "domain/FixedCostTemplate.hpp"
#include "domain/errors/ValidationError.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief fixed add --name <имя> --account <счёт> [--amount N] [--memo T] [--day D]
 *
 * Значения по умолчанию как в форме: -1000, "固定費", 25-е число.
 */
class AddFixedCostHandler : public ICommandHandler {
public:
    static constexpr int64_t DEFAULT_AMOUNT = -1000;
    static constexpr int DEFAULT_DAY = 25;
    static constexpr const char* DEFAULT_MEMO = "固定費";

    explicit AddFixedCostHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        ports::input::CreateTemplateRequest request;
        request.name = args.getOr("name", "");
        request.account = args.get("account");
        request.amount = args.getIntOr("amount", DEFAULT_AMOUNT);
        request.memo = args.getOr("memo", DEFAULT_MEMO);
        const int64_t day = args.getIntOr("day", DEFAULT_DAY);
        if (day < domain::FixedCostTemplate::MIN_DAY || day > domain::FixedCostTemplate::MAX_DAY) {
            throw domain::ValidationError(
                "Fixed cost day must be between 1 and 31, got " + std::to_string(day));
        }
        request.day = static_cast<int>(day);

        response = application::JsonRecordCodec::toJson(ledger_->addTemplate(request));
    }

    std::string description() const override {
        return "fixed add --name NAME --account NAME [--amount N] [--memo TEXT] [--day 1-31]: create a monthly fixed cost";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
