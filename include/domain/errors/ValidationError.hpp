#pragma once

#include <stdexcept>
#include <string>

namespace ledger::domain {

/**
 * @brief Пользовательский ввод не прошёл проверку
 *
 * Операция отклонена целиком: ни память, ни хранилище не изменены.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace ledger::domain
