#pragma once

#include "Transaction.hpp"
#include "Money.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledger::domain {

/**
 * @brief Счёт клиента с журналом операций
 *
 * Инварианты:
 * - balance() >= 0;
 * - balance() совпадает с balanceAfter последней операции (0, если операций нет);
 * - transactionCounter() не убывает и равен числу выпущенных ID операций.
 *
 * Меняется только через deposit() / withdraw() / activate() / deactivate().
 */
class Account {
public:
    /// Сколько последних операций показывает выписка по умолчанию
    static constexpr std::size_t DEFAULT_STATEMENT_LIMIT = 10;

    Account(const std::string& accountId, const std::string& owner,
            Timestamp createdAt = Timestamp::now());

    /**
     * @brief Восстановить счёт из снапшота
     *
     * @throws std::invalid_argument если данные нарушают инварианты счёта
     */
    static Account restore(
        const std::string& accountId,
        const std::string& owner,
        const Money& balance,
        bool isActive,
        std::vector<Transaction> transactions,
        Timestamp createdAt,
        uint64_t transactionCounter
    );

    const std::string& accountId() const { return accountId_; }
    const std::string& owner() const { return owner_; }
    const Money& balance() const { return balance_; }
    bool isActive() const { return active_; }
    const std::vector<Transaction>& transactions() const { return transactions_; }
    const Timestamp& createdAt() const { return createdAt_; }
    uint64_t transactionCounter() const { return transactionCounter_; }

    /**
     * @brief Зачислить средства
     *
     * @throws InactiveAccountError если счёт деактивирован
     * @throws InvalidAmountError если amount <= 0
     */
    Transaction deposit(const Money& amount,
                        const std::optional<std::string>& description = std::nullopt);

    /**
     * @brief Списать средства
     *
     * @throws InactiveAccountError если счёт деактивирован
     * @throws InvalidAmountError если amount <= 0
     * @throws InsufficientFundsError если amount > balance
     */
    Transaction withdraw(const Money& amount,
                         const std::optional<std::string>& description = std::nullopt);

    /**
     * @brief Проверки deposit() без изменения состояния
     */
    void ensureCanDeposit(const Money& amount) const;

    /**
     * @brief Проверки withdraw() без изменения состояния
     */
    void ensureCanWithdraw(const Money& amount) const;

    void activate() { active_ = true; }
    void deactivate() { active_ = false; }

    /**
     * @brief Последние limit операций в хронологическом порядке
     */
    std::vector<Transaction> recentTransactions(std::size_t limit) const;

    /**
     * @brief Текстовая выписка: шапка счёта и последние limit операций
     */
    std::string statement(std::size_t limit = DEFAULT_STATEMENT_LIMIT) const;

private:
    std::string accountId_;
    std::string owner_;
    Money balance_;
    bool active_ = true;
    std::vector<Transaction> transactions_;
    Timestamp createdAt_;
    uint64_t transactionCounter_ = 0;

    std::string nextTransactionId();
    Transaction record(TransactionType type, const Money& amount,
                       const std::optional<std::string>& description);
};

} // namespace ledger::domain
