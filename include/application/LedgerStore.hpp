#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/IDocumentStore.hpp"
#include "ports/output/IClock.hpp"
#include "application/JsonRecordCodec.hpp"
#include "application/RecordNormalizer.hpp"
#include "domain/LedgerState.hpp"
#include "domain/TransactionOrdering.hpp"
#include "domain/enums/Collection.hpp"
#include "domain/enums/RecordKind.hpp"
#include "domain/errors/ValidationError.hpp"
#include "domain/errors/PersistenceError.hpp"
#include "utils/IdGenerator.hpp"
#include "utils/StringUtils.hpp"
#include <algorithm>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace ledger::application {

/**
 * @brief Авторитетное in-memory состояние леджера
 *
 * Владеет тремя коллекциями на время сессии; IDocumentStore - источник
 * истины между сессиями.
 *
 * Все мутации проходят через commit():
 *   копия состояния → мутация копии → сортировка транзакций →
 *   сохранение изменённых коллекций → подмена состояния.
 * Ошибка на любом шаге оставляет состояние в памяти равным последнему
 * успешно сохранённому. Весь цикл выполняется под эксклюзивной блокировкой,
 * чтения - под разделяемой.
 *
 * @note Счета адресуются по ИМЕНИ, берётся первое совпадение.
 *       Переименование счёта "осиротит" его транзакции.
 */
class LedgerStore : public ports::input::ILedgerService {
public:
    /// Возвращает false, если мутация ничего не изменила (сохранение не нужно)
    using Mutation = std::function<bool(domain::LedgerState&)>;

    LedgerStore(
        std::shared_ptr<ports::output::IDocumentStore> store,
        std::shared_ptr<ports::output::IClock> clock
    ) : store_(std::move(store))
      , clock_(std::move(clock))
    {
        load();
        std::clog << "[LedgerStore] Created: " << state_.accounts.size() << " accounts, "
                  << state_.transactions.size() << " transactions, "
                  << state_.templates.size() << " fixed costs" << std::endl;
    }

    // ============================================
    // ACCOUNTS
    // ============================================

    domain::Account addAccount(const std::string& name, int64_t openingBalance) override {
        const std::string trimmed = utils::trim(name);
        if (trimmed.empty()) {
            throw domain::ValidationError("Account name is required");
        }

        domain::Account created;
        commit("addAccount", [&](domain::LedgerState& state) {
            if (findAccountByName(state, trimmed) != state.accounts.end()) {
                std::cerr << "[LedgerStore] WARN duplicate account name '" << trimmed
                          << "', lookups by name will use the first match" << std::endl;
            }
            created = domain::Account(
                utils::IdGenerator::generate(domain::RecordKind::ACCOUNT),
                trimmed,
                openingBalance
            );
            state.accounts.push_back(created);
            return true;
        }, {domain::Collection::ACCOUNTS});

        std::clog << "[LedgerStore] Account added: " << created.id << " '" << created.name
                  << "' balance=" << created.balance << std::endl;
        return created;
    }

    bool deleteAccount(const std::string& id) override {
        bool deleted = false;
        commit("deleteAccount", [&](domain::LedgerState& state) {
            auto it = std::find_if(state.accounts.begin(), state.accounts.end(),
                [&id](const domain::Account& a) { return a.id == id; });
            if (it == state.accounts.end()) {
                return false;
            }
            state.accounts.erase(it);
            deleted = true;
            return true;
        }, {domain::Collection::ACCOUNTS});

        std::clog << "[LedgerStore] deleteAccount " << id << (deleted ? ": removed" : ": not found") << std::endl;
        return deleted;
    }

    // ============================================
    // FIXED COST TEMPLATES
    // ============================================

    domain::FixedCostTemplate addTemplate(const ports::input::CreateTemplateRequest& request) override {
        const std::string name = utils::trim(request.name);
        const std::string account = utils::trim(request.account);
        if (name.empty()) {
            throw domain::ValidationError("Fixed cost name is required");
        }
        if (!domain::FixedCostTemplate::isValidDay(request.day)) {
            throw domain::ValidationError(
                "Fixed cost day must be between 1 and 31, got " + std::to_string(request.day));
        }

        domain::FixedCostTemplate created;
        commit("addTemplate", [&](domain::LedgerState& state) {
            if (findAccountByTrimmedName(state, account) == state.accounts.end()) {
                throw domain::ValidationError("Account not found: '" + account + "'");
            }
            created = domain::FixedCostTemplate(
                utils::IdGenerator::generate(domain::RecordKind::FIXED_COST),
                name,
                account,
                request.amount,
                utils::trim(request.memo),
                request.day
            );
            state.templates.push_back(created);
            return true;
        }, {domain::Collection::FIXED_COSTS});

        std::clog << "[LedgerStore] Fixed cost added: " << created.id << " '" << created.name
                  << "' day=" << created.day << std::endl;
        return created;
    }

    bool deleteTemplate(const std::string& id) override {
        bool deleted = false;
        commit("deleteTemplate", [&](domain::LedgerState& state) {
            auto it = std::find_if(state.templates.begin(), state.templates.end(),
                [&id](const domain::FixedCostTemplate& fc) { return fc.id == id; });
            if (it == state.templates.end()) {
                return false;
            }
            state.templates.erase(it);
            deleted = true;
            return true;
        }, {domain::Collection::FIXED_COSTS});

        std::clog << "[LedgerStore] deleteTemplate " << id << (deleted ? ": removed" : ": not found") << std::endl;
        return deleted;
    }

    // ============================================
    // TRANSACTIONS
    // ============================================

    domain::Transaction addTransaction(
        const domain::CalendarDate& date,
        const std::string& accountName,
        int64_t amount,
        const std::string& memo
    ) override {
        domain::Transaction created;
        bool applied = false;
        commit("addTransaction", [&](domain::LedgerState& state) {
            auto account = findAccountByName(state, accountName);
            if (account != state.accounts.end()) {
                account->balance += amount;
                applied = true;
            }
            created = domain::Transaction(
                utils::IdGenerator::generate(domain::RecordKind::TRANSACTION),
                date.toString(),
                accountName,
                amount,
                utils::trim(memo)
            );
            state.transactions.push_back(created);
            return true;
        }, {domain::Collection::TRANSACTIONS, domain::Collection::ACCOUNTS});

        std::clog << "[LedgerStore] Transaction added: " << created.id << " " << created.date
                  << " '" << created.account << "' " << created.amount
                  << (applied ? "" : " (account not found, balance untouched)") << std::endl;
        return created;
    }

    bool deleteTransaction(const std::string& id) override {
        bool deleted = false;
        commit("deleteTransaction", [&](domain::LedgerState& state) {
            auto it = std::find_if(state.transactions.begin(), state.transactions.end(),
                [&id](const domain::Transaction& tx) { return tx.id == id; });
            if (it == state.transactions.end()) {
                return false;
            }
            auto account = findAccountByName(state, it->account);
            if (account != state.accounts.end()) {
                account->balance -= it->amount;
            }
            state.transactions.erase(it);
            deleted = true;
            return true;
        }, {domain::Collection::TRANSACTIONS, domain::Collection::ACCOUNTS});

        std::clog << "[LedgerStore] deleteTransaction " << id << (deleted ? ": removed" : ": not found") << std::endl;
        return deleted;
    }

    // ============================================
    // READ
    // ============================================

    std::vector<domain::Account> accounts() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return state_.accounts;
    }

    std::vector<domain::Transaction> transactions() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return state_.transactions;
    }

    std::vector<domain::FixedCostTemplate> templates() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return state_.templates;
    }

    domain::LedgerState snapshot() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return state_;
    }

    // ============================================
    // COMMIT
    // ============================================

    /**
     * @brief Атомарно применить мутацию и сохранить изменённые коллекции
     *
     * @param operation Имя операции для логов
     * @param mutation Изменяет копию состояния; может бросить ValidationError
     * @param dirty Коллекции, которые нужно сохранить
     * @throws domain::ValidationError из мутации - ничего не изменено
     * @throws domain::PersistenceError - состояние в памяти не изменено,
     *         уже записанные коллекции откатываются
     */
    void commit(
        const std::string& operation,
        const Mutation& mutation,
        const std::vector<domain::Collection>& dirty
    ) {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        domain::LedgerState next = state_;
        if (!mutation(next)) {
            return;
        }
        domain::sortTransactions(next.transactions);

        std::vector<domain::Collection> written;
        for (auto collection : dirty) {
            try {
                store_->save(domain::toString(collection), encode(next, collection));
                written.push_back(collection);
            } catch (const domain::PersistenceError& e) {
                std::cerr << "[LedgerStore] " << operation << " failed: " << e.what() << std::endl;
                restore(written);
                throw;
            }
        }

        state_ = std::move(next);
    }

    /**
     * @brief Найти счёт по точному совпадению имени (первое совпадение)
     */
    static std::vector<domain::Account>::iterator findAccountByName(
        domain::LedgerState& state, const std::string& name)
    {
        return std::find_if(state.accounts.begin(), state.accounts.end(),
            [&name](const domain::Account& a) { return a.name == name; });
    }

    /**
     * @brief Найти счёт, сравнивая имена без пробелов по краям
     */
    static std::vector<domain::Account>::iterator findAccountByTrimmedName(
        domain::LedgerState& state, const std::string& name)
    {
        const std::string wanted = utils::trim(name);
        return std::find_if(state.accounts.begin(), state.accounts.end(),
            [&wanted](const domain::Account& a) { return utils::trim(a.name) == wanted; });
    }

private:
    std::shared_ptr<ports::output::IDocumentStore> store_;
    std::shared_ptr<ports::output::IClock> clock_;
    domain::LedgerState state_;
    mutable std::shared_mutex mutex_;

    void load() {
        using json = nlohmann::json;

        json accounts = store_->load(domain::toString(domain::Collection::ACCOUNTS), json::array());
        json transactions = store_->load(domain::toString(domain::Collection::TRANSACTIONS), json::array());
        json templates = store_->load(domain::toString(domain::Collection::FIXED_COSTS), json::array());

        RecordNormalizer normalizer(clock_);
        if (normalizer.normalize(accounts, transactions, templates)) {
            store_->save(domain::toString(domain::Collection::ACCOUNTS), accounts);
            store_->save(domain::toString(domain::Collection::TRANSACTIONS), transactions);
            store_->save(domain::toString(domain::Collection::FIXED_COSTS), templates);
            std::clog << "[LedgerStore] Normalized collections persisted" << std::endl;
        }

        state_.accounts = JsonRecordCodec::accountsFromJson(accounts);
        state_.transactions = JsonRecordCodec::transactionsFromJson(transactions);
        state_.templates = JsonRecordCodec::templatesFromJson(templates);
        domain::sortTransactions(state_.transactions);
    }

    static nlohmann::json encode(const domain::LedgerState& state, domain::Collection collection) {
        switch (collection) {
            case domain::Collection::ACCOUNTS:     return JsonRecordCodec::toJsonArray(state.accounts);
            case domain::Collection::TRANSACTIONS: return JsonRecordCodec::toJsonArray(state.transactions);
            case domain::Collection::FIXED_COSTS:  return JsonRecordCodec::toJsonArray(state.templates);
        }
        return nlohmann::json::array();
    }

    // Вернуть на диск содержимое, соответствующее state_ (ещё не подменённому)
    void restore(const std::vector<domain::Collection>& written) {
        for (auto collection : written) {
            try {
                store_->save(domain::toString(collection), encode(state_, collection));
                std::cerr << "[LedgerStore] Restored " << domain::toString(collection) << std::endl;
            } catch (const domain::PersistenceError& e) {
                std::cerr << "[LedgerStore] Restore of " << domain::toString(collection)
                          << " failed, storage diverged: " << e.what() << std::endl;
            }
        }
    }
};

} // namespace ledger::application
