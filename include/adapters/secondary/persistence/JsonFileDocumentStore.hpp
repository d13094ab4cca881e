#pragma once

#include "ports/output/IDocumentStore.hpp"
#include "domain/errors/PersistenceError.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Хранилище документов в JSON-файлах
 *
 * Один файл на ключ: <dataDir>/<key>.json (UTF-8, отступ 2 пробела).
 * Запись идёт во временный файл и переименовывается поверх целевого,
 * поэтому оборванная запись не оставляет усечённый документ.
 */
class JsonFileDocumentStore : public ports::output::IDocumentStore {
public:
    explicit JsonFileDocumentStore(std::filesystem::path dataDir)
        : dataDir_(std::move(dataDir))
    {
        std::clog << "[JsonFileDocumentStore] Data dir: " << dataDir_.string() << std::endl;
    }

    nlohmann::json load(const std::string& key, const nlohmann::json& defaultValue) override {
        std::lock_guard<std::mutex> lock(mutex_);

        const auto path = pathFor(key);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            if (ec) {
                throw domain::PersistenceError(key, "cannot stat " + path.string() + ": " + ec.message());
            }
            return defaultValue;
        }

        std::ifstream input(path, std::ios::binary);
        if (!input) {
            throw domain::PersistenceError(key, "cannot open " + path.string());
        }
        std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        if (input.bad()) {
            throw domain::PersistenceError(key, "read error on " + path.string());
        }

        auto document = nlohmann::json::parse(text, nullptr, false);
        if (document.is_discarded()) {
            std::cerr << "[JsonFileDocumentStore] WARN " << path.string()
                      << " is not valid JSON, using default" << std::endl;
            return defaultValue;
        }
        return document;
    }

    void save(const std::string& key, const nlohmann::json& document) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::error_code ec;
        std::filesystem::create_directories(dataDir_, ec);
        if (ec) {
            throw domain::PersistenceError(key, "cannot create " + dataDir_.string() + ": " + ec.message());
        }

        const auto path = pathFor(key);
        auto tmpPath = path;
        tmpPath += ".tmp";

        {
            std::ofstream output(tmpPath, std::ios::binary | std::ios::trunc);
            if (!output) {
                throw domain::PersistenceError(key, "cannot open " + tmpPath.string() + " for writing");
            }
            output << document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
            output.flush();
            if (!output) {
                throw domain::PersistenceError(key, "write error on " + tmpPath.string());
            }
        }

        std::filesystem::rename(tmpPath, path, ec);
        if (ec) {
            throw domain::PersistenceError(key, "cannot replace " + path.string() + ": " + ec.message());
        }
    }

    std::filesystem::path pathFor(const std::string& key) const {
        return dataDir_ / (key + ".json");
    }

private:
    std::filesystem::path dataDir_;
    std::mutex mutex_;
};

} // namespace ledger::adapters::secondary
