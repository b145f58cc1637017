#pragma once

#include "domain/enums/ErrorKind.hpp"
#include "domain/Money.hpp"
#include <stdexcept>
#include <string>

/**
 * @file LedgerErrors.hpp
 * @brief Исключения леджера
 *
 * Все исключения наследуют LedgerException и несут ErrorKind,
 * по которому вызывающий код выбирает реакцию.
 */

namespace ledger::domain {

/**
 * @brief Базовое исключение леджера
 */
class LedgerException : public std::runtime_error {
public:
    LedgerException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

/**
 * @brief Сумма операции не прошла проверку
 */
class InvalidAmountError : public LedgerException {
public:
    InvalidAmountError(const Money& amount, const std::string& operation)
        : LedgerException(ErrorKind::INVALID_AMOUNT,
              "Invalid " + operation + " amount: " + amount.toDisplayString())
        , amount_(amount)
        , operation_(operation) {}

    const Money& amount() const { return amount_; }
    const std::string& operation() const { return operation_; }

private:
    Money amount_;
    std::string operation_;
};

/**
 * @brief Недостаточно средств для списания
 */
class InsufficientFundsError : public LedgerException {
public:
    InsufficientFundsError(const std::string& accountId, const Money& balance, const Money& amount)
        : LedgerException(ErrorKind::INSUFFICIENT_FUNDS,
              "Insufficient funds in " + accountId + ": balance " + balance.toDisplayString() +
              ", attempted " + amount.toDisplayString() +
              ", short " + (amount - balance).toDisplayString())
        , accountId_(accountId)
        , balance_(balance)
        , amount_(amount)
        , shortfall_(amount - balance) {}

    const std::string& accountId() const { return accountId_; }
    const Money& balance() const { return balance_; }
    const Money& amount() const { return amount_; }
    const Money& shortfall() const { return shortfall_; }

private:
    std::string accountId_;
    Money balance_;
    Money amount_;
    Money shortfall_;
};

class InactiveAccountError : public LedgerException {
public:
    explicit InactiveAccountError(const std::string& accountId)
        : LedgerException(ErrorKind::INACTIVE_ACCOUNT, "Account is inactive: " + accountId)
        , accountId_(accountId) {}

    const std::string& accountId() const { return accountId_; }

private:
    std::string accountId_;
};

class AccountNotFoundError : public LedgerException {
public:
    explicit AccountNotFoundError(const std::string& accountId)
        : LedgerException(ErrorKind::ACCOUNT_NOT_FOUND, "Account not found: " + accountId)
        , accountId_(accountId) {}

    const std::string& accountId() const { return accountId_; }

private:
    std::string accountId_;
};

class InvalidTransferError : public LedgerException {
public:
    explicit InvalidTransferError(const std::string& reason)
        : LedgerException(ErrorKind::INVALID_TRANSFER, "Invalid transfer: " + reason) {}
};

/**
 * @brief Снапшот прочитан, но это не документ леджера
 */
class PersistenceDecodeError : public LedgerException {
public:
    PersistenceDecodeError(const std::string& location, const std::string& detail)
        : LedgerException(ErrorKind::PERSISTENCE_DECODE_FAILURE,
              "Invalid snapshot in " + location + ": " + detail)
        , location_(location) {}

    const std::string& location() const { return location_; }

private:
    std::string location_;
};

/**
 * @brief Снапшот не удалось прочитать или записать
 */
class PersistenceIoError : public LedgerException {
public:
    PersistenceIoError(const std::string& location, const std::string& detail)
        : LedgerException(ErrorKind::PERSISTENCE_IO_FAILURE,
              "Snapshot I/O failed for " + location + ": " + detail)
        , location_(location) {}

    const std::string& location() const { return location_; }

private:
    std::string location_;
};

} // namespace ledger::domain
