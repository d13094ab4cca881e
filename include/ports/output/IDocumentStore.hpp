#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace ledger::ports::output {

/**
 * @brief Интерфейс хранилища документов (Persistence Gateway)
 *
 * Output Port: ключ → JSON-документ. Ядро хранит три документа:
 * "accounts", "transactions", "fixed_costs".
 */
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    /**
     * @brief Загрузить документ
     *
     * @param key Ключ документа
     * @param defaultValue Что вернуть, если документа нет или он повреждён
     * @return Документ или defaultValue
     * @throws domain::PersistenceError при сбое самого хранилища
     */
    virtual nlohmann::json load(const std::string& key, const nlohmann::json& defaultValue) = 0;

    /**
     * @brief Сохранить (полностью заменить) документ
     *
     * @throws domain::PersistenceError если запись не удалась
     */
    virtual void save(const std::string& key, const nlohmann::json& document) = 0;
};

} // namespace ledger::ports::output
