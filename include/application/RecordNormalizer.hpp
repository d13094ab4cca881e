#pragma once

#include "domain/CalendarDate.hpp"
#include "domain/FixedCostTemplate.hpp"
#include "domain/MalformedRecordWarning.hpp"
#include "domain/enums/Collection.hpp"
#include "domain/enums/RecordKind.hpp"
#include "ports/output/IClock.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace ledger::application {

/**
 * @brief Миграция и дозаполнение записей, загруженных из хранилища
 *
 * Работает с "сырыми" JSON-документами: только там поле может отсутствовать.
 * Все исправления выполняются на месте; normalize() возвращает true, если
 * хоть что-то было изменено - тогда вызывающий обязан сразу сохранить
 * коллекции, чтобы новые id стали стабильными.
 *
 * Битые даты транзакций не исправляются (их обрабатывает TransactionOrder),
 * только попадают в warnings().
 */
class RecordNormalizer {
public:
    using json = nlohmann::json;

    static constexpr const char* UNNAMED_ACCOUNT = "名称未設定";

    explicit RecordNormalizer(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    /**
     * @brief Нормализовать три коллекции
     *
     * @return true если хотя бы одно поле было дозаполнено или исправлено
     */
    bool normalize(json& accounts, json& transactions, json& templates) {
        warnings_.clear();
        bool changed = false;

        changed |= normalizeCollection(accounts, domain::Collection::ACCOUNTS,
            [this](json& record, size_t index) {
                bool c = false;
                c |= ensureString(record, "name", UNNAMED_ACCOUNT, domain::Collection::ACCOUNTS, index);
                c |= ensureInteger(record, "balance", 0, domain::Collection::ACCOUNTS, index);
                return c;
            });

        const std::string today = clock_->today().toString();
        changed |= normalizeCollection(transactions, domain::Collection::TRANSACTIONS,
            [this, &today](json& record, size_t index) {
                bool c = false;
                c |= ensureString(record, "date", today, domain::Collection::TRANSACTIONS, index);
                c |= ensureString(record, "account", "", domain::Collection::TRANSACTIONS, index);
                c |= ensureInteger(record, "amount", 0, domain::Collection::TRANSACTIONS, index);
                c |= ensureString(record, "memo", "", domain::Collection::TRANSACTIONS, index);

                const std::string date = record["date"].get<std::string>();
                if (!domain::CalendarDate::parse(date)) {
                    warn(domain::Collection::TRANSACTIONS, index, "date",
                         "unparsable date '" + date + "' kept, sorts last");
                }
                return c;
            });

        changed |= normalizeCollection(templates, domain::Collection::FIXED_COSTS,
            [this](json& record, size_t index) {
                bool c = false;
                c |= ensureString(record, "name", "", domain::Collection::FIXED_COSTS, index);
                c |= ensureString(record, "account", "", domain::Collection::FIXED_COSTS, index);
                c |= ensureInteger(record, "amount", 0, domain::Collection::FIXED_COSTS, index);
                c |= ensureString(record, "memo", "", domain::Collection::FIXED_COSTS, index);
                c |= ensureInteger(record, "day", domain::FixedCostTemplate::MIN_DAY,
                                   domain::Collection::FIXED_COSTS, index);

                const int64_t day = record["day"].get<int64_t>();
                if (day < domain::FixedCostTemplate::MIN_DAY || day > domain::FixedCostTemplate::MAX_DAY) {
                    const int64_t clamped = std::clamp<int64_t>(
                        day, domain::FixedCostTemplate::MIN_DAY, domain::FixedCostTemplate::MAX_DAY);
                    record["day"] = clamped;
                    warn(domain::Collection::FIXED_COSTS, index, "day",
                         "out of range " + std::to_string(day) + ", clamped to " + std::to_string(clamped));
                    c = true;
                }
                return c;
            });

        for (const auto& warning : warnings_) {
            std::cerr << "[RecordNormalizer] WARN " << warning.toString() << std::endl;
        }
        if (changed) {
            std::clog << "[RecordNormalizer] Legacy records backfilled, rewrite required" << std::endl;
        }
        return changed;
    }

    const std::vector<domain::MalformedRecordWarning>& warnings() const {
        return warnings_;
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
    std::vector<domain::MalformedRecordWarning> warnings_;

    template <typename FieldFixer>
    bool normalizeCollection(json& records, domain::Collection collection, FieldFixer fixFields) {
        bool changed = false;

        if (!records.is_array()) {
            warn(collection, 0, "", "document is not an array, replaced with empty collection");
            records = json::array();
            return true;
        }

        json kept = json::array();
        std::unordered_set<std::string> seenIds;
        for (size_t index = 0; index < records.size(); ++index) {
            json& record = records[index];
            if (!record.is_object()) {
                warn(collection, index, "", "not an object, dropped");
                changed = true;
                continue;
            }
            changed |= ensureId(record, collection, index, seenIds);
            changed |= fixFields(record, index);
            kept.push_back(std::move(record));
        }

        records = std::move(kept);
        return changed;
    }

    bool ensureId(json& record, domain::Collection collection, size_t index,
                  std::unordered_set<std::string>& seenIds) {
        auto it = record.find("id");
        std::string reason;
        if (it == record.end()) {
            reason = "missing";
        } else if (!it->is_string() || it->get<std::string>().empty()) {
            reason = "invalid";
        } else if (seenIds.count(it->get<std::string>()) > 0) {
            reason = "duplicate '" + it->get<std::string>() + "'";
        } else {
            seenIds.insert(it->get<std::string>());
            return false;
        }

        std::string id = utils::IdGenerator::generate(kindOf(collection));
        record["id"] = id;
        seenIds.insert(id);
        warn(collection, index, "id", reason + ", assigned " + id);
        return true;
    }

    bool ensureString(json& record, const std::string& field, const std::string& defaultValue,
                      domain::Collection collection, size_t index) {
        auto it = record.find(field);
        if (it == record.end() || it->is_null()) {
            record[field] = defaultValue;
            warn(collection, index, field, "missing, defaulted to '" + defaultValue + "'");
            return true;
        }
        if (it->is_string()) {
            return false;
        }
        if (it->is_number() || it->is_boolean()) {
            std::string converted = it->dump();
            *it = converted;
            warn(collection, index, field, "non-string value converted to '" + converted + "'");
            return true;
        }
        *it = defaultValue;
        warn(collection, index, field, "unsupported type, defaulted to '" + defaultValue + "'");
        return true;
    }

    bool ensureInteger(json& record, const std::string& field, int64_t defaultValue,
                       domain::Collection collection, size_t index) {
        auto it = record.find(field);
        if (it == record.end() || it->is_null()) {
            record[field] = defaultValue;
            warn(collection, index, field, "missing, defaulted to " + std::to_string(defaultValue));
            return true;
        }
        if (it->is_number_integer()) {
            return false;
        }
        if (it->is_number_float() && fitsInt64(it->get<double>())) {
            auto truncated = static_cast<int64_t>(it->get<double>());
            *it = truncated;
            warn(collection, index, field, "fractional value truncated to " + std::to_string(truncated));
            return true;
        }
        if (it->is_string()) {
            if (auto parsed = parseInteger(it->get<std::string>())) {
                *it = *parsed;
                warn(collection, index, field, "string value parsed as " + std::to_string(*parsed));
                return true;
            }
        }
        *it = defaultValue;
        warn(collection, index, field, "not an integer, defaulted to " + std::to_string(defaultValue));
        return true;
    }

    // [-2^63, 2^63): NaN и бесконечности сюда не попадают
    static bool fitsInt64(double value) {
        return std::isfinite(value)
            && value >= -9223372036854775808.0
            && value < 9223372036854775808.0;
    }

    static std::optional<int64_t> parseInteger(const std::string& str) {
        try {
            size_t consumed = 0;
            long long value = std::stoll(str, &consumed);
            if (consumed != str.size()) {
                return std::nullopt;
            }
            return static_cast<int64_t>(value);
        } catch (const std::logic_error&) {
            // std::invalid_argument / std::out_of_range
            return std::nullopt;
        }
    }

    static domain::RecordKind kindOf(domain::Collection collection) {
        switch (collection) {
            case domain::Collection::ACCOUNTS:     return domain::RecordKind::ACCOUNT;
            case domain::Collection::TRANSACTIONS: return domain::RecordKind::TRANSACTION;
            case domain::Collection::FIXED_COSTS:  return domain::RecordKind::FIXED_COST;
        }
        return domain::RecordKind::ACCOUNT;
    }

    void warn(domain::Collection collection, size_t index, const std::string& field, const std::string& detail) {
        warnings_.push_back(domain::MalformedRecordWarning{collection, index, field, detail});
    }
};

} // namespace ledger::application
