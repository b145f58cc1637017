#pragma once

#include "enums/TransactionType.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Операция по счёту
 *
 * Создаётся только методами Account::deposit / Account::withdraw
 * и больше не меняется: счёт отдаёт наружу лишь копии и const-ссылки.
 */
struct Transaction {
    std::string id;                         ///< "{accountId}-TXN-0001"
    TransactionType type = TransactionType::DEPOSIT;
    Money amount;                           ///< Всегда > 0
    Money balanceAfter;                     ///< Баланс счёта сразу после операции
    Timestamp timestamp;                    ///< Время создания (UTC)
    std::optional<std::string> description; ///< Комментарий

    Transaction() = default;

    Transaction(
        const std::string& id,
        TransactionType type,
        const Money& amount,
        const Money& balanceAfter,
        const std::optional<std::string>& description = std::nullopt,
        Timestamp timestamp = Timestamp::now()
    ) : id(id), type(type), amount(amount), balanceAfter(balanceAfter),
        timestamp(timestamp), description(description) {}

    bool operator==(const Transaction& other) const {
        return id == other.id && type == other.type && amount == other.amount &&
               balanceAfter == other.balanceAfter && timestamp == other.timestamp &&
               description == other.description;
    }
    bool operator!=(const Transaction& other) const { return !(*this == other); }
};

} // namespace ledger::domain
