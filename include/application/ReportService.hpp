#pragma once

#include "ports/input/IReportService.hpp"
#include "ports/input/ILedgerService.hpp"
#include "ports/output/IClock.hpp"
#include "domain/LedgerState.hpp"
#include "domain/PeriodSummary.hpp"
#include "utils/StringUtils.hpp"
#include <memory>

namespace ledger::application {

/**
 * @brief Метрики: общий баланс, доход и расход за период
 *
 * Только чтение: работает над снимком состояния, ничего не сохраняет.
 */
class ReportService : public ports::input::IReportService {
public:
    ReportService(
        std::shared_ptr<ports::input::ILedgerService> ledger,
        std::shared_ptr<ports::output::IClock> clock
    ) : ledger_(std::move(ledger))
      , clock_(std::move(clock))
    {}

    int64_t totalBalance() const override {
        return totalBalance(ledger_->snapshot());
    }

    int64_t periodIncome(const std::string& periodPrefix) const override {
        return periodIncome(ledger_->snapshot(), periodPrefix);
    }

    int64_t periodExpense(const std::string& periodPrefix) const override {
        return periodExpense(ledger_->snapshot(), periodPrefix);
    }

    domain::PeriodSummary summary(const std::string& periodPrefix) const override {
        return summarize(ledger_->snapshot(), periodPrefix);
    }

    std::string currentPeriod() const override {
        return clock_->today().monthPrefix();
    }

    // ============================================
    // Чистые функции над снимком
    // ============================================

    static int64_t totalBalance(const domain::LedgerState& state) {
        int64_t total = 0;
        for (const auto& account : state.accounts) {
            total += account.balance;
        }
        return total;
    }

    static int64_t periodIncome(const domain::LedgerState& state, const std::string& periodPrefix) {
        int64_t income = 0;
        for (const auto& tx : state.transactions) {
            if (tx.isIncome() && utils::startsWith(tx.date, periodPrefix)) {
                income += tx.amount;
            }
        }
        return income;
    }

    static int64_t periodExpense(const domain::LedgerState& state, const std::string& periodPrefix) {
        int64_t expense = 0;
        for (const auto& tx : state.transactions) {
            if (tx.isExpense() && utils::startsWith(tx.date, periodPrefix)) {
                expense -= tx.amount;
            }
        }
        return expense;
    }

    static domain::PeriodSummary summarize(const domain::LedgerState& state, const std::string& periodPrefix) {
        domain::PeriodSummary summary;
        summary.period = periodPrefix;
        summary.totalBalance = totalBalance(state);
        summary.income = periodIncome(state, periodPrefix);
        summary.expense = periodExpense(state, periodPrefix);
        return summary;
    }

private:
    std::shared_ptr<ports::input::ILedgerService> ledger_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace ledger::application
