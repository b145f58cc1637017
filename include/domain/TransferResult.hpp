#pragma once

#include "enums/ErrorKind.hpp"
#include "enums/TransferStatus.hpp"
#include "Transaction.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Результат перевода без исключений
 *
 * При COMPLETED заполнены withdrawal и deposit,
 * при REJECTED - errorKind и message.
 */
struct TransferResult {
    TransferStatus status = TransferStatus::REJECTED;
    std::optional<ErrorKind> errorKind;     ///< Причина отказа
    std::string message;                    ///< Текст ошибки или подтверждение
    std::optional<Transaction> withdrawal;  ///< Списание со счёта-источника
    std::optional<Transaction> deposit;     ///< Зачисление на счёт-получатель
    Timestamp timestamp;                    ///< Время ответа

    bool isSuccess() const {
        return status == TransferStatus::COMPLETED;
    }
};

} // namespace ledger::domain
