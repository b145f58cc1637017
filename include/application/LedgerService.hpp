#pragma once

#include "ports/input/ILedgerService.hpp"
#include "ports/output/ISnapshotStore.hpp"
#include "settings/ILedgerSettings.hpp"
#include "domain/AmountValidation.hpp"
#include "domain/LedgerState.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace ledger::application {

/**
 * @brief Леджер: реестр счетов и переводы
 *
 * Реализует ILedgerService поверх ISnapshotStore:
 * - при создании загружает снапшот (повреждённый - предупреждение и пустой леджер,
 *   если не включён strict load);
 * - после каждой изменяющей операции записывает снапшот целиком;
 * - все операции сериализованы одним мьютексом.
 *
 * Если запись снапшота не удалась, операция в памяти уже выполнена:
 * наружу летит PersistenceIoError, леджер помечается dirty и повторяет запись
 * при следующей операции, flush() или в деструкторе.
 */
class LedgerService : public ports::input::ILedgerService {
public:
    LedgerService(
        std::shared_ptr<ports::output::ISnapshotStore> store,
        std::shared_ptr<settings::ILedgerSettings> settings
    ) : store_(std::move(store))
      , settings_(std::move(settings))
    {
        if (!store_ || !settings_) {
            throw std::invalid_argument("LedgerService requires a snapshot store and settings");
        }
        hydrate();
        std::cout << "[LedgerService] Created" << std::endl;
    }

    ~LedgerService() override {
        if (!dirty_) {
            return;
        }
        try {
            store_->save(state_);
            std::cout << "[LedgerService] Final flush to " << store_->location() << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[LedgerService] Final flush failed, unsaved changes lost: "
                      << e.what() << std::endl;
        }
    }

    LedgerService(const LedgerService&) = delete;
    LedgerService& operator=(const LedgerService&) = delete;

    domain::Account createAccount(
        const std::string& owner,
        const domain::Money& initialDeposit = domain::Money::zero()
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        domain::requireNonNegativeAmount(initialDeposit, "initial deposit");

        domain::Account account(nextAccountId(), owner);
        if (initialDeposit.isPositive()) {
            // Начальный взнос проходит тем же путём, что и обычное зачисление
            account.deposit(initialDeposit, std::string("Initial deposit"));
        }

        state_.accounts.emplace(account.accountId(), account);
        std::cout << "[LedgerService] Created account " << account.accountId()
                  << " for " << owner
                  << " (initial balance: " << account.balance().toDisplayString() << ")"
                  << std::endl;

        persistLocked();
        return account;
    }

    domain::Account getAccount(const std::string& accountId) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return findLocked(accountId);
    }

    std::vector<domain::Account> listAccounts() const override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::Account> result;
        result.reserve(state_.accounts.size());
        for (const auto& [id, account] : state_.accounts) {
            result.push_back(account);
        }
        return result;
    }

    domain::Transaction deposit(
        const std::string& accountId,
        const domain::Money& amount,
        const std::optional<std::string>& description = std::nullopt
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& account = findLocked(accountId);
        auto txn = account.deposit(amount, description);
        std::cout << "[LedgerService] Deposited " << amount.toDisplayString()
                  << " to " << accountId
                  << " (balance: " << account.balance().toDisplayString() << ")" << std::endl;

        persistLocked();
        return txn;
    }

    domain::Transaction withdraw(
        const std::string& accountId,
        const domain::Money& amount,
        const std::optional<std::string>& description = std::nullopt
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& account = findLocked(accountId);
        auto txn = account.withdraw(amount, description);
        std::cout << "[LedgerService] Withdrew " << amount.toDisplayString()
                  << " from " << accountId
                  << " (balance: " << account.balance().toDisplayString() << ")" << std::endl;

        persistLocked();
        return txn;
    }

    std::pair<domain::Transaction, domain::Transaction> transfer(
        const std::string& fromAccountId,
        const std::string& toAccountId,
        const domain::Money& amount,
        const std::optional<std::string>& description = std::nullopt
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto legs = commitTransferLocked(fromAccountId, toAccountId, amount, description);
        persistLocked();
        return legs;
    }

    /**
     * @brief Перевод с результатом вместо исключений
     *
     * Ошибки валидации дают REJECTED без изменений балансов.
     * Если перевод проведён, но снапшот не записался - COMPLETED
     * с errorKind = PERSISTENCE_IO_FAILURE.
     */
    domain::TransferResult tryTransfer(const domain::TransferRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);

        domain::TransferResult result;
        try {
            auto legs = commitTransferLocked(
                request.fromAccountId, request.toAccountId, request.amount, request.description);
            result.status = domain::TransferStatus::COMPLETED;
            result.withdrawal = legs.first;
            result.deposit = legs.second;
            result.message = "Transfer completed";
        } catch (const domain::LedgerException& e) {
            std::cerr << "[LedgerService] Transfer rejected: " << e.what() << std::endl;
            result.status = domain::TransferStatus::REJECTED;
            result.errorKind = e.kind();
            result.message = e.what();
            return result;
        }

        try {
            persistLocked();
        } catch (const domain::PersistenceIoError& e) {
            result.errorKind = e.kind();
            result.message = std::string("Transfer completed, snapshot not saved: ") + e.what();
        }
        return result;
    }

    domain::Account deactivateAccount(const std::string& accountId) override {
        return setActive(accountId, false);
    }

    domain::Account activateAccount(const std::string& accountId) override {
        return setActive(accountId, true);
    }

    domain::Money getTotalBalance() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalBalanceLocked();
    }

    domain::LedgerStats getStats() const override {
        std::lock_guard<std::mutex> lock(mutex_);

        domain::LedgerStats stats;
        stats.totalAccounts = state_.accounts.size();
        for (const auto& [id, account] : state_.accounts) {
            if (account.isActive()) {
                ++stats.activeAccounts;
            } else {
                ++stats.inactiveAccounts;
            }
            stats.totalTransactions += account.transactions().size();
        }
        stats.totalBalance = totalBalanceLocked();
        return stats;
    }

    std::string getStatement(
        const std::string& accountId,
        std::optional<std::size_t> limit = std::nullopt
    ) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return findLocked(accountId).statement(limit.value_or(settings_->getStatementLimit()));
    }

    std::string getSummary() const override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ostringstream ss;
        ss << std::string(50, '=') << "\n"
           << "ACCOUNT SUMMARY\n"
           << std::string(50, '=') << "\n";
        for (const auto& [id, account] : state_.accounts) {
            ss << id << ": " << account.owner() << " - " << account.balance().toDisplayString();
            if (!account.isActive()) {
                ss << " (inactive)";
            }
            ss << "\n";
        }
        ss << "\nTotal accounts: " << state_.accounts.size() << "\n"
           << "Total balance (active): " << totalBalanceLocked().toDisplayString();
        return ss.str();
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        persistLocked();
    }

private:
    std::shared_ptr<ports::output::ISnapshotStore> store_;
    std::shared_ptr<settings::ILedgerSettings> settings_;
    domain::LedgerState state_;
    bool dirty_ = false;
    mutable std::mutex mutex_;

    void hydrate() {
        try {
            state_ = store_->load();
            std::cout << "[LedgerService] Loaded " << state_.accounts.size()
                      << " accounts from " << store_->location() << std::endl;
        } catch (const domain::PersistenceDecodeError& e) {
            if (settings_->isStrictLoad()) {
                throw;
            }
            std::cerr << "[LedgerService] WARNING: " << e.what()
                      << "; starting with an empty ledger" << std::endl;
            state_ = domain::LedgerState::empty();
        }
    }

    void persistLocked() {
        try {
            store_->save(state_);
            dirty_ = false;
        } catch (const domain::PersistenceIoError& e) {
            dirty_ = true;
            std::cerr << "[LedgerService] Failed to save snapshot: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Account& findLocked(const std::string& accountId) {
        auto it = state_.accounts.find(accountId);
        if (it == state_.accounts.end()) {
            throw domain::AccountNotFoundError(accountId);
        }
        return it->second;
    }

    const domain::Account& findLocked(const std::string& accountId) const {
        auto it = state_.accounts.find(accountId);
        if (it == state_.accounts.end()) {
            throw domain::AccountNotFoundError(accountId);
        }
        return it->second;
    }

    std::string nextAccountId() {
        std::string id;
        do {
            ++state_.accountCounter;
            std::ostringstream ss;
            ss << "ACC-" << std::setw(6) << std::setfill('0') << state_.accountCounter;
            id = ss.str();
        } while (state_.accounts.count(id) > 0);
        return id;
    }

    domain::Money totalBalanceLocked() const {
        domain::Money total;
        for (const auto& [id, account] : state_.accounts) {
            if (account.isActive()) {
                total += account.balance();
            }
        }
        return total;
    }

    domain::Account setActive(const std::string& accountId, bool active) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& account = findLocked(accountId);
        if (active) {
            account.activate();
        } else {
            account.deactivate();
        }
        std::cout << "[LedgerService] Account " << accountId
                  << (active ? " activated" : " deactivated") << std::endl;

        persistLocked();
        return account;
    }

    /**
     * @brief Провести обе ноги перевода в памяти
     *
     * Сначала проверяются обе ноги, потом списание, потом зачисление.
     * Если зачисление всё же упало, на источник возвращается компенсирующее зачисление.
     */
    std::pair<domain::Transaction, domain::Transaction> commitTransferLocked(
        const std::string& fromAccountId,
        const std::string& toAccountId,
        const domain::Money& amount,
        const std::optional<std::string>& description
    ) {
        auto& source = findLocked(fromAccountId);
        auto& target = findLocked(toAccountId);

        if (fromAccountId == toAccountId) {
            throw domain::InvalidTransferError(
                "source and destination are the same account " + fromAccountId);
        }

        source.ensureCanWithdraw(amount);
        target.ensureCanDeposit(amount);

        const std::string suffix = description ? ": " + *description : "";
        auto withdrawal = source.withdraw(amount, "Transfer to " + toAccountId + suffix);

        try {
            auto deposit = target.deposit(amount, "Transfer from " + fromAccountId + suffix);
            std::cout << "[LedgerService] Transferred " << amount.toDisplayString()
                      << " from " << fromAccountId << " to " << toAccountId << std::endl;
            return {withdrawal, deposit};
        } catch (const domain::LedgerException& e) {
            source.deposit(amount, "Transfer reversal: " + withdrawal.id);
            std::cerr << "[LedgerService] Deposit leg failed, reversed " << withdrawal.id
                      << ": " << e.what() << std::endl;
            dirty_ = true;
            throw;
        }
    }
};

} // namespace ledger::application
