#pragma once

#include "Account.hpp"
#include <cstdint>
#include <map>
#include <string>

namespace ledger::domain {

/**
 * @brief Полное состояние леджера для записи в снапшот
 *
 * accountCounter - сколько ID счетов уже выдано; следующий ID будет
 * "ACC-{accountCounter + 1:06d}". Ключи accounts отсортированы как строки:
 * до ACC-999999 это порядок создания, дальше (7+ цифр) уже нет.
 */
struct LedgerState {
    std::map<std::string, Account> accounts;   ///< accountId -> Account
    uint64_t accountCounter = 0;                ///< Выданные ID счетов

    static LedgerState empty() {
        return LedgerState{};
    }

    bool isEmpty() const {
        return accounts.empty() && accountCounter == 0;
    }
};

} // namespace ledger::domain
