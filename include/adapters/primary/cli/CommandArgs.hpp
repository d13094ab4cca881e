#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ledger::adapters::primary::cli {

/**
 * @brief Разобранная командная строка: позиционные слова + опции
 *
 * household-ledger tx add --date 2024-05-01 --amount=-500 --memo "ランチ"
 *   positional: ["tx", "add"]
 *   options:    {date: 2024-05-01, amount: -500, memo: ランチ}
 *
 * Значение опции может начинаться с '-' (отрицательные суммы),
 * но не с "--".
 */
class CommandArgs {
public:
    /**
     * @throws std::invalid_argument если у опции нет значения
     */
    static CommandArgs parse(const std::vector<std::string>& tokens) {
        CommandArgs args;
        for (size_t i = 0; i < tokens.size(); ++i) {
            const std::string& token = tokens[i];
            if (token.rfind("--", 0) != 0) {
                args.positional_.push_back(token);
                continue;
            }

            std::string key = token.substr(2);
            auto eq = key.find('=');
            if (eq != std::string::npos) {
                args.options_[key.substr(0, eq)] = key.substr(eq + 1);
                continue;
            }
            if (key.empty()) {
                throw std::invalid_argument("Empty option name");
            }
            if (i + 1 >= tokens.size() || tokens[i + 1].rfind("--", 0) == 0) {
                throw std::invalid_argument("Option --" + key + " requires a value");
            }
            args.options_[key] = tokens[++i];
        }
        return args;
    }

    const std::vector<std::string>& positional() const { return positional_; }

    bool has(const std::string& key) const {
        return options_.count(key) > 0;
    }

    std::optional<std::string> find(const std::string& key) const {
        auto it = options_.find(key);
        if (it == options_.end()) return std::nullopt;
        return it->second;
    }

    /**
     * @throws std::invalid_argument если опции нет
     */
    std::string get(const std::string& key) const {
        auto value = find(key);
        if (!value) {
            throw std::invalid_argument("Missing required option --" + key);
        }
        return *value;
    }

    std::string getOr(const std::string& key, const std::string& defaultValue) const {
        return find(key).value_or(defaultValue);
    }

    /**
     * @throws std::invalid_argument если опции нет или это не целое число
     */
    int64_t getInt(const std::string& key) const {
        return toInt(key, get(key));
    }

    int64_t getIntOr(const std::string& key, int64_t defaultValue) const {
        auto value = find(key);
        return value ? toInt(key, *value) : defaultValue;
    }

private:
    std::vector<std::string> positional_;
    std::map<std::string, std::string> options_;

    static int64_t toInt(const std::string& key, const std::string& value) {
        try {
            size_t consumed = 0;
            long long parsed = std::stoll(value, &consumed);
            if (consumed == value.size()) {
                return static_cast<int64_t>(parsed);
            }
        } catch (const std::logic_error&) {
            // падаем ниже с понятным сообщением
        }
        throw std::invalid_argument("Option --" + key + " must be an integer, got '" + value + "'");
    }
};

} // namespace ledger::adapters::primary::cli
