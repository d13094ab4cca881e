#pragma once

#include "domain/Account.hpp"
#include "domain/Transaction.hpp"
#include "domain/FixedCostTemplate.hpp"
#include "domain/CalendarDate.hpp"
#include "domain/LedgerState.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Данные для создания шаблона фиксированного платежа
 */
struct CreateTemplateRequest {
    std::string name;
    std::string account;
    int64_t amount = 0;
    std::string memo;
    int day = 1;
};

/**
 * @brief Интерфейс хранилища леджера (счета, транзакции, шаблоны)
 *
 * Input Port. Каждая мутация атомарна: либо применена и сохранена,
 * либо состояние не изменилось. После любой мутации баланс каждого
 * счёта согласован с его транзакциями.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Создать счёт
     * @throws domain::ValidationError если имя пустое
     */
    virtual domain::Account addAccount(const std::string& name, int64_t openingBalance) = 0;

    /**
     * @brief Удалить счёт (транзакции не трогаются)
     * @return false если счёта не было
     */
    virtual bool deleteAccount(const std::string& id) = 0;

    /**
     * @brief Создать шаблон
     * @throws domain::ValidationError если имя пустое, день вне 1..31
     *         или счёт с таким именем не существует
     */
    virtual domain::FixedCostTemplate addTemplate(const CreateTemplateRequest& request) = 0;

    /**
     * @return false если шаблона не было
     */
    virtual bool deleteTemplate(const std::string& id) = 0;

    /**
     * @brief Записать доход/расход
     *
     * Если счёт с таким именем найден - баланс меняется на amount.
     * Если нет - транзакция всё равно записывается, баланс не трогается.
     */
    virtual domain::Transaction addTransaction(
        const domain::CalendarDate& date,
        const std::string& accountName,
        int64_t amount,
        const std::string& memo
    ) = 0;

    /**
     * @brief Удалить транзакцию, откатив её вклад в баланс
     * @return false если транзакции не было
     */
    virtual bool deleteTransaction(const std::string& id) = 0;

    virtual std::vector<domain::Account> accounts() const = 0;
    virtual std::vector<domain::Transaction> transactions() const = 0;
    virtual std::vector<domain::FixedCostTemplate> templates() const = 0;
    virtual domain::LedgerState snapshot() const = 0;
};

} // namespace ledger::ports::input
