#pragma once

#include "enums/Collection.hpp"
#include <cstddef>
#include <string>

namespace ledger::domain {

/**
 * @brief Нефатальное замечание о записи, загруженной из хранилища
 */
struct MalformedRecordWarning {
    Collection collection;
    size_t index = 0;           ///< Позиция записи в исходном документе
    std::string field;          ///< Пусто - замечание ко всей записи
    std::string detail;

    std::string toString() const {
        std::string result = ledger::domain::toString(collection) + "[" + std::to_string(index) + "]";
        if (!field.empty()) {
            result += "." + field;
        }
        return result + ": " + detail;
    }
};

} // namespace ledger::domain
