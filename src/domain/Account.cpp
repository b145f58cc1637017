#include "domain/Account.hpp"
#include "domain/AmountValidation.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace ledger::domain {

Account::Account(const std::string& accountId, const std::string& owner, Timestamp createdAt)
    : accountId_(accountId)
    , owner_(owner)
    , createdAt_(createdAt)
{}

Account Account::restore(
    const std::string& accountId,
    const std::string& owner,
    const Money& balance,
    bool isActive,
    std::vector<Transaction> transactions,
    Timestamp createdAt,
    uint64_t transactionCounter)
{
    if (balance.isNegative()) {
        throw std::invalid_argument("negative balance " + balance.toString() + " in " + accountId);
    }

    for (const auto& txn : transactions) {
        if (!txn.amount.isPositive()) {
            throw std::invalid_argument("non-positive amount in transaction " + txn.id);
        }
    }

    const Money expected = transactions.empty() ? Money::zero() : transactions.back().balanceAfter;
    if (balance != expected) {
        throw std::invalid_argument("balance " + balance.toString() + " of " + accountId +
                                    " does not match last balance_after " + expected.toString());
    }

    if (transactionCounter < transactions.size()) {
        throw std::invalid_argument("transaction counter of " + accountId +
                                    " is below the number of transactions");
    }

    Account account(accountId, owner, createdAt);
    account.balance_ = balance;
    account.active_ = isActive;
    account.transactions_ = std::move(transactions);
    account.transactionCounter_ = transactionCounter;
    return account;
}

void Account::ensureCanDeposit(const Money& amount) const {
    if (!active_) {
        throw InactiveAccountError(accountId_);
    }
    requirePositiveAmount(amount, "deposit");
    // Запас в одну единицу на перенос из nano
    if (amount.units > std::numeric_limits<int64_t>::max() - balance_.units - 1) {
        throw InvalidAmountError(amount, "deposit");
    }
}

void Account::ensureCanWithdraw(const Money& amount) const {
    if (!active_) {
        throw InactiveAccountError(accountId_);
    }
    requirePositiveAmount(amount, "withdrawal");
    if (amount > balance_) {
        throw InsufficientFundsError(accountId_, balance_, amount);
    }
}

Transaction Account::deposit(const Money& amount, const std::optional<std::string>& description) {
    ensureCanDeposit(amount);

    balance_ += amount;
    return record(TransactionType::DEPOSIT, amount, description);
}

Transaction Account::withdraw(const Money& amount, const std::optional<std::string>& description) {
    ensureCanWithdraw(amount);

    balance_ -= amount;
    return record(TransactionType::WITHDRAWAL, amount, description);
}

std::vector<Transaction> Account::recentTransactions(std::size_t limit) const {
    const std::size_t count = std::min(limit, transactions_.size());
    return std::vector<Transaction>(transactions_.end() - static_cast<std::ptrdiff_t>(count),
                                    transactions_.end());
}

std::string Account::statement(std::size_t limit) const {
    std::ostringstream ss;
    ss << "Account Statement: " << accountId_ << "\n"
       << "Owner: " << owner_ << "\n"
       << "Current Balance: " << balance_.toDisplayString() << "\n"
       << "Status: " << (active_ ? "Active" : "Inactive") << "\n"
       << std::string(60, '-') << "\n"
       << "Transactions:";

    for (const auto& txn : recentTransactions(limit)) {
        ss << "\n  " << txn.timestamp.format("%Y-%m-%d %H:%M")
           << " | " << std::left << std::setw(10) << toString(txn.type)
           << " | $" << std::right << std::setw(10) << txn.amount.toString()
           << " | Balance: $" << std::setw(10) << txn.balanceAfter.toString();
        if (txn.description) {
            ss << " | " << *txn.description;
        }
    }

    return ss.str();
}

std::string Account::nextTransactionId() {
    ++transactionCounter_;

    std::ostringstream ss;
    ss << accountId_ << "-TXN-" << std::setw(4) << std::setfill('0') << transactionCounter_;
    return ss.str();
}

Transaction Account::record(TransactionType type, const Money& amount,
                            const std::optional<std::string>& description) {
    Transaction txn(nextTransactionId(), type, amount, balance_, description);
    transactions_.push_back(txn);
    return txn;
}

} // namespace ledger::domain
