#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "ports/input/IReportService.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief summary [--period YYYY-MM] - общий баланс, доход и расход за месяц
 */
class SummaryHandler : public ICommandHandler {
public:
    explicit SummaryHandler(std::shared_ptr<ports::input::IReportService> reports)
        : reports_(std::move(reports)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        auto summary = reports_->summary(args.getOr("period", reports_->currentPeriod()));

        response["period"] = summary.period;
        response["total_balance"] = summary.totalBalance;
        response["income"] = summary.income;
        response["expense"] = summary.expense;
    }

    std::string description() const override {
        return "summary [--period YYYY-MM]: total balance and the month's income/expense";
    }

private:
    std::shared_ptr<ports::input::IReportService> reports_;
};

} // namespace ledger::adapters::primary::cli
