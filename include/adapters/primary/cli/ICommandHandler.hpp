#pragma once

#include "adapters/primary/cli/CommandArgs.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ledger::adapters::primary::cli {

/**
 * @brief Обработчик одной команды CLI (Primary Adapter)
 *
 * Заполняет JSON-ответ; ошибки сообщает исключениями
 * (ValidationError, PersistenceError, std::invalid_argument),
 * которые LedgerCli превращает в код возврата.
 */
class ICommandHandler {
public:
    virtual ~ICommandHandler() = default;

    virtual void handle(const CommandArgs& args, nlohmann::json& response) = 0;

    /**
     * @brief Однострочное описание для "help"
     */
    virtual std::string description() const = 0;
};

} // namespace ledger::adapters::primary::cli
