#pragma once

#include "adapters/primary/cli/CommandArgs.hpp"
#include "adapters/primary/cli/ICommandHandler.hpp"
#include "domain/errors/ValidationError.hpp"
#include "domain/errors/PersistenceError.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger::adapters::primary::cli {

/**
 * @brief Диспетчер команд: "<group> [action] [--key value ...]" → handler
 *
 * Ответ handler-а печатается в out как JSON. Коды возврата:
 *   0 - успех
 *   1 - непредвиденная ошибка
 *   2 - ValidationError / неверные аргументы / неизвестная команда
 *   3 - PersistenceError
 */
class LedgerCli {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_INTERNAL = 1;
    static constexpr int EXIT_USAGE = 2;
    static constexpr int EXIT_PERSISTENCE = 3;

    void registerCommand(const std::string& command, std::shared_ptr<ICommandHandler> handler) {
        handlers_[command] = std::move(handler);
    }

    bool hasCommand(const std::string& command) const {
        return handlers_.count(command) > 0;
    }

    int run(const std::vector<std::string>& tokens, std::ostream& out) {
        nlohmann::json response = nlohmann::json::object();
        int code = dispatch(tokens, response);
        out << response.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
        return code;
    }

private:
    std::map<std::string, std::shared_ptr<ICommandHandler>> handlers_;

    int dispatch(const std::vector<std::string>& tokens, nlohmann::json& response) {
        try {
            auto args = CommandArgs::parse(tokens);
            const std::string command = commandName(args.positional());

            if (command.empty() || command == "help") {
                response = help();
                return EXIT_OK;
            }

            auto it = handlers_.find(command);
            if (it == handlers_.end()) {
                response = error("Unknown command: " + command);
                response["help"] = help()["commands"];
                return EXIT_USAGE;
            }

            it->second->handle(args, response);
            return EXIT_OK;

        } catch (const domain::ValidationError& e) {
            std::cerr << "[LedgerCli] Rejected: " << e.what() << std::endl;
            response = error(e.what());
            return EXIT_USAGE;
        } catch (const std::invalid_argument& e) {
            response = error(e.what());
            return EXIT_USAGE;
        } catch (const domain::PersistenceError& e) {
            std::cerr << "[LedgerCli] Storage failure: " << e.what() << std::endl;
            response = error(e.what());
            return EXIT_PERSISTENCE;
        } catch (const std::exception& e) {
            std::cerr << "[LedgerCli] Unexpected error: " << e.what() << std::endl;
            response = error(e.what());
            return EXIT_INTERNAL;
        }
    }

    static std::string commandName(const std::vector<std::string>& positional) {
        std::string name;
        for (const auto& word : positional) {
            if (!name.empty()) name += " ";
            name += word;
        }
        return name;
    }

    nlohmann::json help() const {
        nlohmann::json commands = nlohmann::json::array();
        for (const auto& [name, handler] : handlers_) {
            commands.push_back({{"command", name}, {"description", handler->description()}});
        }
        return nlohmann::json{{"commands", commands}};
    }

    static nlohmann::json error(const std::string& message) {
        return nlohmann::json{{"error", message}};
    }
};

} // namespace ledger::adapters::primary::cli
