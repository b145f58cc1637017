#pragma once

#include "domain/Account.hpp"
#include "domain/LedgerStats.hpp"
#include "domain/Money.hpp"
#include "domain/Transaction.hpp"
#include "domain/TransferRequest.hpp"
#include "domain/TransferResult.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger::ports::input {

/**
 * @brief Интерфейс леджера
 *
 * Input Port: реестр счетов, операции по ним и переводы.
 * Каждая изменяющая операция сразу записывает снапшот.
 * Счета наружу отдаются копиями.
 */
class ILedgerService {
public:
    virtual ~ILedgerService() = default;

    /**
     * @brief Открыть счёт
     *
     * @param owner Владелец
     * @param initialDeposit Начальный взнос (0 - без операции)
     * @return Созданный Account
     * @throws domain::InvalidAmountError если initialDeposit < 0
     */
    virtual domain::Account createAccount(
        const std::string& owner,
        const domain::Money& initialDeposit = domain::Money::zero()
    ) = 0;

    /**
     * @brief Получить счёт по ID
     *
     * @throws domain::AccountNotFoundError если счёта нет
     */
    virtual domain::Account getAccount(const std::string& accountId) const = 0;

    /**
     * @brief Все счета в порядке создания
     */
    virtual std::vector<domain::Account> listAccounts() const = 0;

    /**
     * @brief Зачислить на счёт
     */
    virtual domain::Transaction deposit(
        const std::string& accountId,
        const domain::Money& amount,
        const std::optional<std::string>& description = std::nullopt
    ) = 0;

    /**
     * @brief Списать со счёта
     */
    virtual domain::Transaction withdraw(
        const std::string& accountId,
        const domain::Money& amount,
        const std::optional<std::string>& description = std::nullopt
    ) = 0;

    /**
     * @brief Перевести между счетами
     *
     * @return Пара (списание, зачисление)
     * @throws domain::AccountNotFoundError, domain::InsufficientFundsError,
     *         domain::InvalidAmountError, domain::InactiveAccountError,
     *         domain::InvalidTransferError
     */
    virtual std::pair<domain::Transaction, domain::Transaction> transfer(
        const std::string& fromAccountId,
        const std::string& toAccountId,
        const domain::Money& amount,
        const std::optional<std::string>& description = std::nullopt
    ) = 0;

    /**
     * @brief Перевод с результатом вместо исключений для ошибок леджера
     */
    virtual domain::TransferResult tryTransfer(const domain::TransferRequest& request) = 0;

    /**
     * @brief Деактивировать счёт (операции по нему запрещены)
     */
    virtual domain::Account deactivateAccount(const std::string& accountId) = 0;

    /**
     * @brief Снова активировать счёт
     */
    virtual domain::Account activateAccount(const std::string& accountId) = 0;

    /**
     * @brief Сумма балансов активных счетов
     */
    virtual domain::Money getTotalBalance() const = 0;

    virtual domain::LedgerStats getStats() const = 0;

    /**
     * @brief Выписка по счёту
     *
     * @param limit Сколько последних операций показать (по умолчанию - из настроек)
     */
    virtual std::string getStatement(
        const std::string& accountId,
        std::optional<std::size_t> limit = std::nullopt
    ) const = 0;

    /**
     * @brief Текстовая сводка по всем счетам
     */
    virtual std::string getSummary() const = 0;

    /**
     * @brief Принудительно записать снапшот
     */
    virtual void flush() = 0;
};

} // namespace ledger::ports::input
