#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "application/JsonRecordCodec.hpp"
#include "ports/input/ILedgerService.hpp"
#include "utils/StringUtils.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief tx list [--period YYYY-MM]
 *
 * Новые сверху: обратный порядок относительно TransactionOrder.
 */
class ListTransactionsHandler : public ICommandHandler {
public:
    explicit ListTransactionsHandler(std::shared_ptr<ports::input::ILedgerService> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        const std::string period = args.getOr("period", "");
        const auto transactions = ledger_->transactions();

        nlohmann::json items = nlohmann::json::array();
        for (auto it = transactions.rbegin(); it != transactions.rend(); ++it) {
            if (utils::startsWith(it->date, period)) {
                items.push_back(application::JsonRecordCodec::toJson(*it));
            }
        }
        response["transactions"] = std::move(items);
    }

    std::string description() const override {
        return "tx list [--period YYYY-MM]: show transactions, newest first";
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
};

} // namespace ledger::adapters::primary::cli
