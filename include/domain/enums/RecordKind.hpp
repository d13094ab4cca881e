#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Вид записи - определяет префикс идентификатора
 */
enum class RecordKind {
    ACCOUNT,
    TRANSACTION,
    FIXED_COST
};

/**
 * @brief Префикс id: "acc", "tx", "fc"
 */
inline std::string toString(RecordKind kind) {
    switch (kind) {
        case RecordKind::ACCOUNT:     return "acc";
        case RecordKind::TRANSACTION: return "tx";
        case RecordKind::FIXED_COST:  return "fc";
    }
    return "rec";
}

} // namespace ledger::domain
