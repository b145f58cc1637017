#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Вид ошибки леджера
 *
 * Вызывающий код ветвится по виду ошибки, а не по типу исключения.
 */
enum class ErrorKind {
    INVALID_AMOUNT,             ///< Неположительная (или отрицательная для открытия) сумма
    INSUFFICIENT_FUNDS,         ///< Сумма списания больше баланса
    INACTIVE_ACCOUNT,           ///< Операция над деактивированным счётом
    ACCOUNT_NOT_FOUND,          ///< Неизвестный ID счёта
    INVALID_TRANSFER,           ///< Перевод на тот же самый счёт
    PERSISTENCE_DECODE_FAILURE, ///< Снапшот не читается как документ леджера
    PERSISTENCE_IO_FAILURE      ///< Снапшот не удалось прочитать/записать
};

/**
 * @brief Преобразовать в строку
 */
inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_AMOUNT:             return "INVALID_AMOUNT";
        case ErrorKind::INSUFFICIENT_FUNDS:         return "INSUFFICIENT_FUNDS";
        case ErrorKind::INACTIVE_ACCOUNT:           return "INACTIVE_ACCOUNT";
        case ErrorKind::ACCOUNT_NOT_FOUND:          return "ACCOUNT_NOT_FOUND";
        case ErrorKind::INVALID_TRANSFER:           return "INVALID_TRANSFER";
        case ErrorKind::PERSISTENCE_DECODE_FAILURE: return "PERSISTENCE_DECODE_FAILURE";
        case ErrorKind::PERSISTENCE_IO_FAILURE:     return "PERSISTENCE_IO_FAILURE";
    }
    return "UNKNOWN";
}

/**
 * @brief Ошибка хранилища, а не бизнес-правила
 */
inline bool isPersistenceError(ErrorKind kind) {
    return kind == ErrorKind::PERSISTENCE_DECODE_FAILURE ||
           kind == ErrorKind::PERSISTENCE_IO_FAILURE;
}

} // namespace ledger::domain
