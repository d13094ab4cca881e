#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Сбой чтения или записи в хранилище
 */
class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& key, const std::string& message)
        : std::runtime_error("Persistence failure for '" + key + "': " + message)
        , key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

} // namespace ledger::domain
