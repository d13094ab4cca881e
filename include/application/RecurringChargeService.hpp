#pragma once

#include "ports/input/IRecurringChargeService.hpp"
#include "ports/output/IClock.hpp"
#include "application/LedgerStore.hpp"
#include "domain/ApplyResult.hpp"
#include "domain/FixedCostTemplate.hpp"
#include "domain/enums/Collection.hpp"
#include "utils/IdGenerator.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <memory>

namespace ledger::application {

/**
 * @brief Пакетное добавление фиксированных платежей за текущий месяц
 *
 * Для каждого шаблона, по порядку:
 * 1. день месяца ещё не наступил      → skippedFuture
 * 2. такая транзакция уже есть        → skippedDuplicate
 *    (сравнение по значению: дата, счёт, сумма, memo "固定費:<name>[ / <memo>]")
 * 3. счёта с таким именем нет          → skippedNoAccount
 * 4. иначе создаётся транзакция и меняется баланс → added
 *
 * Весь пакет - одна транзакция LedgerStore::commit(); обе коллекции
 * сохраняются всегда, даже если ничего не добавлено.
 */
class RecurringChargeService : public ports::input::IRecurringChargeService {
public:
    RecurringChargeService(
        std::shared_ptr<LedgerStore> ledger,
        std::shared_ptr<ports::output::IClock> clock
    ) : ledger_(std::move(ledger))
      , clock_(std::move(clock))
    {}

    domain::ApplyResult applyForDate(const domain::CalendarDate& today) override {
        domain::ApplyResult result;
        const std::string monthPrefix = today.monthPrefix();

        ledger_->commit("applyFixedCosts", [&](domain::LedgerState& state) {
            result = domain::ApplyResult{};
            for (const auto& fc : state.templates) {
                if (today.day() < fc.day) {
                    ++result.skippedFuture;
                    continue;
                }

                const std::string targetDate = composeDate(monthPrefix, fc.day);
                const std::string account = utils::trim(fc.account);
                const std::string memo = composeMemo(fc);

                if (isDuplicate(state, targetDate, account, fc.amount, memo)) {
                    ++result.skippedDuplicate;
                    continue;
                }

                auto target = LedgerStore::findAccountByTrimmedName(state, account);
                if (target == state.accounts.end()) {
                    ++result.skippedNoAccount;
                    std::cerr << "[RecurringChargeService] Account '" << account
                              << "' not found for fixed cost " << fc.id << std::endl;
                    continue;
                }

                target->balance += fc.amount;
                state.transactions.emplace_back(
                    utils::IdGenerator::generate(domain::RecordKind::TRANSACTION),
                    targetDate,
                    account,
                    fc.amount,
                    memo
                );
                ++result.added;
            }
            return true;
        }, {domain::Collection::TRANSACTIONS, domain::Collection::ACCOUNTS});

        std::clog << "[RecurringChargeService] " << today.toString()
                  << ": added=" << result.added
                  << " skipped_future=" << result.skippedFuture
                  << " skipped_dup=" << result.skippedDuplicate
                  << " skipped_no_account=" << result.skippedNoAccount << std::endl;
        return result;
    }

    domain::ApplyResult applyForToday() override {
        return applyForDate(clock_->today());
    }

    /**
     * @brief memo генерируемой транзакции: "固定費:<name>" [+ " / <memo>"]
     */
    static std::string composeMemo(const domain::FixedCostTemplate& fc) {
        std::string memo = std::string(domain::FixedCostTemplate::MEMO_PREFIX) + utils::trim(fc.name);
        const std::string extra = utils::trim(fc.memo);
        if (!extra.empty()) {
            memo += " / " + extra;
        }
        return memo;
    }

    /**
     * @brief "YYYY-MM" + "-DD" (день дополняется нулём до двух цифр)
     */
    static std::string composeDate(const std::string& monthPrefix, int day) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "-%02d", day);
        return monthPrefix + buf;
    }

private:
    std::shared_ptr<LedgerStore> ledger_;
    std::shared_ptr<ports::output::IClock> clock_;

    static bool isDuplicate(
        const domain::LedgerState& state,
        const std::string& date,
        const std::string& account,
        int64_t amount,
        const std::string& memo)
    {
        return std::any_of(state.transactions.begin(), state.transactions.end(),
            [&](const domain::Transaction& tx) {
                return tx.date == date
                    && utils::trim(tx.account) == account
                    && tx.amount == amount
                    && utils::trim(tx.memo) == memo;
            });
    }
};

} // namespace ledger::application
