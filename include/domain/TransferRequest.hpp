#pragma once

#include "Money.hpp"
#include <optional>
#include <string>

namespace ledger::domain {

/**
 * @brief Запрос на перевод между счетами
 */
struct TransferRequest {
    std::string fromAccountId;              ///< Счёт списания
    std::string toAccountId;                ///< Счёт зачисления
    Money amount;                           ///< Сумма перевода
    std::optional<std::string> description; ///< Комментарий к обеим операциям
};

} // namespace ledger::domain
