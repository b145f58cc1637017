#pragma once

#include <string>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Тип операции по счёту
 */
enum class TransactionType {
    DEPOSIT,    ///< Зачисление
    WITHDRAWAL  ///< Списание
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(TransactionType type) {
    switch (type) {
        case TransactionType::DEPOSIT:    return "DEPOSIT";
        case TransactionType::WITHDRAWAL: return "WITHDRAWAL";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline TransactionType transactionTypeFromString(const std::string& str) {
    if (str == "DEPOSIT")    return TransactionType::DEPOSIT;
    if (str == "WITHDRAWAL") return TransactionType::WITHDRAWAL;
    throw std::invalid_argument("Unknown TransactionType: " + str);
}

/**
 * @brief Увеличивает ли операция баланс
 */
inline bool isCredit(TransactionType type) {
    return type == TransactionType::DEPOSIT;
}

} // namespace ledger::domain
