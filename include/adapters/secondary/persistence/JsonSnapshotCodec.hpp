#pragma once

#include "domain/LedgerState.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Преобразование состояния леджера в JSON-документ и обратно
 *
 * Формат документа:
 * {
 *   "accounts": { "<id>": { "account_id", "owner", "balance", "transactions": [...],
 *                           "created_at", "_transaction_counter", "is_active" } },
 *   "_account_counter": N
 * }
 *
 * Суммы пишутся числами с полной точностью, время - ISO 8601 UTC.
 */
class JsonSnapshotCodec {
public:
    static nlohmann::ordered_json toJson(const domain::LedgerState& state);

    /**
     * @param source Откуда документ (для текста ошибки)
     * @throws domain::PersistenceDecodeError если документ не описывает леджер
     */
    static domain::LedgerState fromJson(const nlohmann::ordered_json& document,
                                        const std::string& source);

    static std::string encode(const domain::LedgerState& state, int indent = 2);

    /**
     * @throws domain::PersistenceDecodeError если текст не JSON или не документ леджера
     */
    static domain::LedgerState decode(const std::string& content, const std::string& source);
};

} // namespace ledger::adapters::secondary
