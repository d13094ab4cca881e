#pragma once

#include "domain/enums/RecordKind.hpp"
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>

namespace ledger::utils {

/**
 * @brief Генератор идентификаторов записей
 *
 * Формат: "<prefix>-<24 hex>", т.е. 96 случайных бит на идентификатор.
 * Коллизия с ранее сохранёнными данными практически исключена.
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class IdGenerator {
public:
    static constexpr size_t RANDOM_HEX_DIGITS = 24;

    /**
     * @brief Сгенерировать id для записи заданного вида ("acc-...", "tx-...", "fc-...")
     */
    static std::string generate(domain::RecordKind kind) {
        return generateWithPrefix(domain::toString(kind));
    }

    /**
     * @brief Сгенерировать id с произвольным префиксом
     *
     * @param prefix Префикс (например, "acc", "tx", "fc")
     * @return ID в формате "prefix-xxxxxxxxxxxxxxxxxxxxxxxx"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;

        uint64_t high = dist(gen);
        uint64_t low = dist(gen);

        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0');
        ss << std::setw(8) << (high & 0xFFFFFFFF);
        ss << std::setw(16) << low;
        return ss.str();
    }
};

} // namespace ledger::utils
