#pragma once

#include "ports/output/IDocumentStore.hpp"
#include "domain/errors/PersistenceError.hpp"
#include "settings/DbSettings.hpp"
#include <nlohmann/json.hpp>
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>

namespace ledger::adapters::secondary {

/**
 * @brief Хранилище документов в PostgreSQL
 *
 * Таблица ledger_documents: key → body (JSONB). Таблица создаётся
 * при подключении, если её нет. save - upsert в одной транзакции.
 */
class PostgresDocumentStore : public ports::output::IDocumentStore {
public:
    explicit PostgresDocumentStore(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::clog << "[PostgresDocumentStore] Connecting to " << settings_->getHost()
                  << ":" << settings_->getPort() << "/" << settings_->getName() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            ensureSchema();
            std::clog << "[PostgresDocumentStore] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentStore] Connection failed: " << e.what() << std::endl;
            throw domain::PersistenceError("ledger_documents", e.what());
        }
    }

    ~PostgresDocumentStore() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    nlohmann::json load(const std::string& key, const nlohmann::json& defaultValue) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string body;
        try {
            pqxx::work txn(*connection_);
            auto result = txn.exec_params(
                "SELECT body::text FROM ledger_documents WHERE key = $1",
                key
            );
            txn.commit();

            if (result.empty()) {
                return defaultValue;
            }
            body = result[0][0].as<std::string>();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentStore] load() failed: " << e.what() << std::endl;
            throw domain::PersistenceError(key, e.what());
        }

        auto document = nlohmann::json::parse(body, nullptr, false);
        if (document.is_discarded()) {
            std::cerr << "[PostgresDocumentStore] WARN document '" << key
                      << "' is not valid JSON, using default" << std::endl;
            return defaultValue;
        }
        return document;
    }

    void save(const std::string& key, const nlohmann::json& document) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);
            txn.exec_params(
                R"(
                    INSERT INTO ledger_documents (key, body, updated_at)
                    VALUES ($1, $2::jsonb, NOW())
                    ON CONFLICT (key) DO UPDATE SET
                        body = EXCLUDED.body,
                        updated_at = EXCLUDED.updated_at
                )",
                key,
                document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
            );
            txn.commit();
        } catch (const std::exception& e) {
            std::cerr << "[PostgresDocumentStore] save() failed: " << e.what() << std::endl;
            throw domain::PersistenceError(key, e.what());
        }
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    void ensureSchema() {
        pqxx::work txn(*connection_);
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS ledger_documents (
                key        TEXT PRIMARY KEY,
                body       JSONB NOT NULL,
                updated_at TIMESTAMPTZ NOT NULL DEFAULT NOW()
            )
        )");
        txn.commit();
    }
};

} // namespace ledger::adapters::secondary
