#pragma once

#include <string>

namespace ledger::domain {

/**
 * @brief Итог перевода между счетами
 */
enum class TransferStatus {
    COMPLETED,  ///< Обе ноги проведены
    REJECTED    ///< Перевод отклонён, балансы не изменились
};

inline std::string toString(TransferStatus status) {
    switch (status) {
        case TransferStatus::COMPLETED: return "COMPLETED";
        case TransferStatus::REJECTED:  return "REJECTED";
    }
    return "UNKNOWN";
}

} // namespace ledger::domain
