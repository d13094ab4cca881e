#pragma once

#include "ports/output/IDocumentStore.hpp"
#include "domain/errors/PersistenceError.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

namespace ledger::adapters::secondary {

/**
 * @brief Декоратор IDocumentStore с ограниченным числом повторов
 *
 * Повторяет load/save при PersistenceError до maxAttempts раз
 * с фиксированной паузой; после последней попытки пробрасывает ошибку.
 * Остальные исключения не перехватываются.
 */
class RetryingDocumentStore : public ports::output::IDocumentStore {
public:
    RetryingDocumentStore(
        std::shared_ptr<ports::output::IDocumentStore> delegate,
        int maxAttempts,
        std::chrono::milliseconds delay
    ) : delegate_(std::move(delegate))
      , maxAttempts_(maxAttempts)
      , delay_(delay)
    {
        if (maxAttempts_ < 1) {
            throw std::invalid_argument("RetryingDocumentStore: maxAttempts must be >= 1");
        }
    }

    nlohmann::json load(const std::string& key, const nlohmann::json& defaultValue) override {
        return withRetry("load", key, [&]() {
            return delegate_->load(key, defaultValue);
        });
    }

    void save(const std::string& key, const nlohmann::json& document) override {
        withRetry("save", key, [&]() {
            delegate_->save(key, document);
            return true;
        });
    }

    int getMaxAttempts() const { return maxAttempts_; }

private:
    std::shared_ptr<ports::output::IDocumentStore> delegate_;
    int maxAttempts_;
    std::chrono::milliseconds delay_;

    template <typename Operation>
    auto withRetry(const char* name, const std::string& key, Operation operation) -> decltype(operation()) {
        for (int attempt = 1;; ++attempt) {
            try {
                return operation();
            } catch (const domain::PersistenceError& e) {
                if (attempt >= maxAttempts_) {
                    std::cerr << "[RetryingDocumentStore] " << name << " '" << key
                              << "' gave up after " << attempt << " attempts" << std::endl;
                    throw;
                }
                std::cerr << "[RetryingDocumentStore] " << name << " '" << key << "' attempt "
                          << attempt << "/" << maxAttempts_ << " failed: " << e.what() << std::endl;
            }
            if (delay_.count() > 0) {
                std::this_thread::sleep_for(delay_);
            }
        }
    }
};

} // namespace ledger::adapters::secondary
