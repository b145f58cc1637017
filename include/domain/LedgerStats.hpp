#pragma once

#include "Money.hpp"
#include <cstddef>

namespace ledger::domain {

/**
 * @brief Сводные показатели леджера
 */
struct LedgerStats {
    std::size_t totalAccounts = 0;      ///< Все счета
    std::size_t activeAccounts = 0;     ///< Активные
    std::size_t inactiveAccounts = 0;   ///< Деактивированные
    std::size_t totalTransactions = 0;  ///< Операции по всем счетам
    Money totalBalance;                 ///< Сумма балансов активных счетов
};

} // namespace ledger::domain
