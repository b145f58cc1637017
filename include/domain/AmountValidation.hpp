#pragma once

#include "domain/Money.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <string>

namespace ledger::domain {

/**
 * @brief Проверка суммы для операций, меняющих баланс
 *
 * @param operation Название операции для сообщения об ошибке ("deposit", "withdrawal", ...)
 * @throws InvalidAmountError если amount <= 0
 */
inline void requirePositiveAmount(const Money& amount, const std::string& operation) {
    if (!amount.isPositive()) {
        throw InvalidAmountError(amount, operation);
    }
}

/**
 * @brief Проверка суммы, для которой ноль допустим (начальный взнос)
 *
 * @throws InvalidAmountError если amount < 0
 */
inline void requireNonNegativeAmount(const Money& amount, const std::string& operation) {
    if (amount.isNegative()) {
        throw InvalidAmountError(amount, operation);
    }
}

} // namespace ledger::domain
