#pragma once

#include "adapters/primary/cli/ICommandHandler.hpp"
#include "adapters/primary/cli/DateOption.hpp"
#include "ports/input/IRecurringChargeService.hpp"
#include "ports/output/IClock.hpp"
#include <memory>

namespace ledger::adapters::primary::cli {

/**
 * @brief fixed apply [--date YYYY-MM-DD] - 今月の固定費を一括追加
 */
class ApplyFixedCostsHandler : public ICommandHandler {
public:
    ApplyFixedCostsHandler(
        std::shared_ptr<ports::input::IRecurringChargeService> recurring,
        std::shared_ptr<ports::output::IClock> clock
    ) : recurring_(std::move(recurring))
      , clock_(std::move(clock)) {}

    void handle(const CommandArgs& args, nlohmann::json& response) override {
        const auto date = dateOptionOrToday(args, *clock_);
        const auto result = recurring_->applyForDate(date);

        response["date"] = date.toString();
        response["added"] = result.added;
        response["skipped_future"] = result.skippedFuture;
        response["skipped_dup"] = result.skippedDuplicate;
        response["skipped_no_account"] = result.skippedNoAccount;
    }

    std::string description() const override {
        return "fixed apply [--date YYYY-MM-DD]: add this month's due fixed costs (idempotent)";
    }

private:
    std::shared_ptr<ports::input::IRecurringChargeService> recurring_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace ledger::adapters::primary::cli
