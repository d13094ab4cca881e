#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include "domain/FixedCostTemplate.hpp"
#include <nlohmann/json.hpp>
#include <vector>

namespace ledger::application {

/**
 * @brief Отображение доменных записей на JSON-раскладку документов
 *
 * accounts:     {id, name, balance}
 * transactions: {id, date, account, amount, memo}
 * fixed_costs:  {id, name, account, amount, memo, day}
 *
 * Декодирование рассчитано на уже нормализованные записи
 * (см. application::RecordNormalizer), но не падает на пропусках.
 */
class JsonRecordCodec {
public:
    using json = nlohmann::json;

    // ============================================
    // ACCOUNTS
    // ============================================

    static json toJson(const domain::Account& account) {
        return json{
            {"id", account.id},
            {"name", account.name},
            {"balance", account.balance}
        };
    }

    static domain::Account accountFromJson(const json& j) {
        return domain::Account(
            j.value("id", ""),
            j.value("name", ""),
            j.value("balance", int64_t{0})
        );
    }

    // ============================================
    // TRANSACTIONS
    // ============================================

    static json toJson(const domain::Transaction& tx) {
        return json{
            {"id", tx.id},
            {"date", tx.date},
            {"account", tx.account},
            {"amount", tx.amount},
            {"memo", tx.memo}
        };
    }

    static domain::Transaction transactionFromJson(const json& j) {
        return domain::Transaction(
            j.value("id", ""),
            j.value("date", ""),
            j.value("account", ""),
            j.value("amount", int64_t{0}),
            j.value("memo", "")
        );
    }

    // ============================================
    // FIXED COSTS
    // ============================================

    static json toJson(const domain::FixedCostTemplate& fc) {
        return json{
            {"id", fc.id},
            {"name", fc.name},
            {"account", fc.account},
            {"amount", fc.amount},
            {"memo", fc.memo},
            {"day", fc.day}
        };
    }

    static domain::FixedCostTemplate templateFromJson(const json& j) {
        return domain::FixedCostTemplate(
            j.value("id", ""),
            j.value("name", ""),
            j.value("account", ""),
            j.value("amount", int64_t{0}),
            j.value("memo", ""),
            j.value("day", domain::FixedCostTemplate::MIN_DAY)
        );
    }

    // ============================================
    // COLLECTIONS
    // ============================================

    template <typename Record>
    static json toJsonArray(const std::vector<Record>& records) {
        json array = json::array();
        for (const auto& record : records) {
            array.push_back(toJson(record));
        }
        return array;
    }

    static std::vector<domain::Account> accountsFromJson(const json& array) {
        std::vector<domain::Account> result;
        for (const auto& item : array) {
            result.push_back(accountFromJson(item));
        }
        return result;
    }

    static std::vector<domain::Transaction> transactionsFromJson(const json& array) {
        std::vector<domain::Transaction> result;
        for (const auto& item : array) {
            result.push_back(transactionFromJson(item));
        }
        return result;
    }

    static std::vector<domain::FixedCostTemplate> templatesFromJson(const json& array) {
        std::vector<domain::FixedCostTemplate> result;
        for (const auto& item : array) {
            result.push_back(templateFromJson(item));
        }
        return result;
    }
};

} // namespace ledger::application
