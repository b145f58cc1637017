#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/LedgerService.hpp"
#include "adapters/secondary/persistence/InMemorySnapshotStore.hpp"
#include "mocks/MockSnapshotStore.hpp"
#include "mocks/StaticLedgerSettings.hpp"

using namespace ledger;
using namespace ledger::domain;
using ledger::adapters::secondary::InMemorySnapshotStore;
using ledger::application::LedgerService;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

// ============================================================================
// Test Fixture
// ============================================================================

class LedgerServiceTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemorySnapshotStore> store;
    std::shared_ptr<tests::StaticLedgerSettings> settings;
    std::unique_ptr<LedgerService> ledger;

    void SetUp() override {
        store = std::make_shared<InMemorySnapshotStore>();
        settings = std::make_shared<tests::StaticLedgerSettings>();
        ledger = std::make_unique<LedgerService>(store, settings);
    }

    std::unique_ptr<LedgerService> reopen() {
        return std::make_unique<LedgerService>(store, settings);
    }
};

// ================================================================
// CREATE / GET
// ================================================================

TEST_F(LedgerServiceTest, CreateAccount_AssignsSequentialIds) {
    auto alice = ledger->createAccount("Alice", Money(1000));
    auto bob = ledger->createAccount("Bob");

    EXPECT_EQ(alice.accountId(), "ACC-000001");
    EXPECT_EQ(bob.accountId(), "ACC-000002");
    EXPECT_EQ(alice.owner(), "Alice");
    EXPECT_TRUE(alice.isActive());
}

TEST_F(LedgerServiceTest, CreateAccount_InitialDepositIsFirstTransaction) {
    auto alice = ledger->createAccount("Alice", Money(1000));

    ASSERT_EQ(alice.transactions().size(), 1u);
    const auto& txn = alice.transactions().front();
    EXPECT_EQ(txn.id, "ACC-000001-TXN-0001");
    EXPECT_EQ(txn.type, TransactionType::DEPOSIT);
    EXPECT_EQ(txn.amount, Money(1000));
    EXPECT_EQ(txn.description.value_or(""), "Initial deposit");
    EXPECT_EQ(alice.balance(), Money(1000));
}

TEST_F(LedgerServiceTest, CreateAccount_ZeroDeposit_NoTransaction) {
    auto account = ledger->createAccount("Carol");

    EXPECT_TRUE(account.balance().isZero());
    EXPECT_TRUE(account.transactions().empty());
}

TEST_F(LedgerServiceTest, CreateAccount_NegativeDeposit_Throws) {
    EXPECT_THROW(ledger->createAccount("Mallory", Money(-1)), InvalidAmountError);
    EXPECT_TRUE(ledger->listAccounts().empty());
    EXPECT_EQ(ledger->createAccount("Dave").accountId(), "ACC-000001");
}

TEST_F(LedgerServiceTest, GetAccount_Unknown_ThrowsWithoutCreating) {
    try {
        ledger->getAccount("INVALID-123");
        FAIL() << "Expected AccountNotFoundError";
    } catch (const AccountNotFoundError& e) {
        EXPECT_EQ(e.accountId(), "INVALID-123");
        EXPECT_EQ(e.kind(), ErrorKind::ACCOUNT_NOT_FOUND);
    }
    EXPECT_TRUE(ledger->listAccounts().empty());
    EXPECT_EQ(ledger->getStats().totalAccounts, 0u);
}

TEST_F(LedgerServiceTest, GetAccount_ReturnsSnapshotCopy) {
    auto id = ledger->createAccount("Alice", Money(100)).accountId();

    auto copy = ledger->getAccount(id);
    copy.deposit(Money(50));

    EXPECT_EQ(ledger->getAccount(id).balance(), Money(100));
}

// ================================================================
// DEPOSIT / WITHDRAW
// ================================================================

TEST_F(LedgerServiceTest, DepositWithdraw_UpdateBalance) {
    auto id = ledger->createAccount("Alice", Money(1000)).accountId();

    ledger->deposit(id, Money(250), std::string("Salary bonus"));
    auto txn = ledger->withdraw(id, Money(100), std::string("Groceries"));

    EXPECT_EQ(txn.id, id + "-TXN-0003");
    EXPECT_EQ(ledger->getAccount(id).balance(), Money(1150));
}

TEST_F(LedgerServiceTest, Deposit_UnknownAccount_Throws) {
    EXPECT_THROW(ledger->deposit("ACC-999999", Money(10)), AccountNotFoundError);
}

// ================================================================
// TOTAL BALANCE / STATS
// ================================================================

TEST_F(LedgerServiceTest, TotalBalance_ExcludesInactive) {
    ledger->createAccount("A", Money(1000));
    ledger->createAccount("B", Money(500));
    auto c = ledger->createAccount("C", Money(300)).accountId();

    ledger->deactivateAccount(c);

    EXPECT_EQ(ledger->getTotalBalance(), Money(1500));

    auto stats = ledger->getStats();
    EXPECT_EQ(stats.totalAccounts, 3u);
    EXPECT_EQ(stats.activeAccounts, 2u);
    EXPECT_EQ(stats.inactiveAccounts, 1u);
    EXPECT_EQ(stats.totalTransactions, 3u);
    EXPECT_EQ(stats.totalBalance, Money(1500));

    ledger->activateAccount(c);
    EXPECT_EQ(ledger->getTotalBalance(), Money(1800));
}

TEST_F(LedgerServiceTest, TotalBalance_EmptyLedger_IsZero) {
    EXPECT_TRUE(ledger->getTotalBalance().isZero());
}

TEST_F(LedgerServiceTest, Deactivated_RejectsOperations) {
    auto id = ledger->createAccount("A", Money(100)).accountId();
    ledger->deactivateAccount(id);

    EXPECT_THROW(ledger->deposit(id, Money(1)), InactiveAccountError);
    EXPECT_THROW(ledger->withdraw(id, Money(1)), InactiveAccountError);
    EXPECT_FALSE(ledger->getAccount(id).isActive());
}

// ================================================================
// STATEMENT / SUMMARY
// ================================================================

TEST_F(LedgerServiceTest, Statement_UsesConfiguredLimit) {
    settings->statementLimit = 2;
    auto id = ledger->createAccount("A", Money(100)).accountId();
    ledger->deposit(id, Money(1), std::string("first"));
    ledger->deposit(id, Money(1), std::string("second"));

    auto text = ledger->getStatement(id);
    EXPECT_EQ(text.find("Initial deposit"), std::string::npos);
    EXPECT_NE(text.find("second"), std::string::npos);

    auto full = ledger->getStatement(id, 10);
    EXPECT_NE(full.find("Initial deposit"), std::string::npos);
}

TEST_F(LedgerServiceTest, Summary_ListsAccountsAndActiveTotal) {
    ledger->createAccount("Alice", Money(1000));
    auto bob = ledger->createAccount("Bob", Money(500)).accountId();
    ledger->deactivateAccount(bob);

    auto text = ledger->getSummary();

    EXPECT_NE(text.find("ACCOUNT SUMMARY"), std::string::npos);
    EXPECT_NE(text.find("ACC-000001: Alice - $1000.00"), std::string::npos);
    EXPECT_NE(text.find("ACC-000002: Bob - $500.00 (inactive)"), std::string::npos);
    EXPECT_NE(text.find("Total accounts: 2"), std::string::npos);
    EXPECT_NE(text.find("Total balance (active): $1000.00"), std::string::npos);
}

// ================================================================
// PERSISTENCE
// ================================================================

TEST_F(LedgerServiceTest, EveryMutation_WritesSnapshot) {
    auto id = ledger->createAccount("A", Money(100)).accountId();
    ledger->deposit(id, Money(1));
    ledger->withdraw(id, Money(1));

    EXPECT_EQ(store->saveCount(), 3);
}

TEST_F(LedgerServiceTest, FailedOperation_DoesNotWriteSnapshot) {
    auto id = ledger->createAccount("A", Money(100)).accountId();
    EXPECT_THROW(ledger->withdraw(id, Money(1000)), InsufficientFundsError);

    EXPECT_EQ(store->saveCount(), 1);
}

TEST_F(LedgerServiceTest, Reopen_RestoresAccountsAndCounters) {
    auto alice = ledger->createAccount("Alice", Money(1000)).accountId();
    auto bob = ledger->createAccount("Bob", Money(500)).accountId();
    ledger->transfer(alice, bob, Money(200), std::string("Rent payment"));
    ledger->deactivateAccount(bob);

    auto reopened = reopen();

    EXPECT_EQ(reopened->getAccount(alice).balance(), Money(800));
    EXPECT_EQ(reopened->getAccount(bob).balance(), Money(700));
    EXPECT_FALSE(reopened->getAccount(bob).isActive());
    EXPECT_EQ(reopened->getAccount(alice).transactions(),
              ledger->getAccount(alice).transactions());

    EXPECT_EQ(reopened->createAccount("Carol").accountId(), "ACC-000003");
    EXPECT_EQ(reopened->deposit(alice, Money(1)).id, alice + "-TXN-0003");
}

TEST(LedgerServiceLoadTest, CorruptSnapshot_StartsEmpty) {
    auto store = std::make_shared<InMemorySnapshotStore>("{ not json");
    auto settings = std::make_shared<tests::StaticLedgerSettings>();

    LedgerService ledger(store, settings);

    EXPECT_TRUE(ledger.listAccounts().empty());
    EXPECT_EQ(ledger.createAccount("Alice").accountId(), "ACC-000001");
}

TEST(LedgerServiceLoadTest, CorruptSnapshot_StrictMode_Throws) {
    auto store = std::make_shared<InMemorySnapshotStore>("[1, 2, 3]");
    auto settings = std::make_shared<tests::StaticLedgerSettings>();
    settings->strictLoad = true;

    EXPECT_THROW(LedgerService(store, settings), PersistenceDecodeError);
}

TEST(LedgerServiceLoadTest, NullDependencies_Throw) {
    auto settings = std::make_shared<tests::StaticLedgerSettings>();
    EXPECT_THROW(LedgerService(nullptr, settings), std::invalid_argument);
}

// ================================================================
// SAVE FAILURES
// ================================================================

class LedgerServiceSaveFailureTest : public ::testing::Test {
protected:
    std::shared_ptr<NiceMock<tests::MockSnapshotStore>> store;
    std::shared_ptr<tests::StaticLedgerSettings> settings;

    void SetUp() override {
        store = std::make_shared<NiceMock<tests::MockSnapshotStore>>();
        settings = std::make_shared<tests::StaticLedgerSettings>();
        ON_CALL(*store, load()).WillByDefault(Return(LedgerState::empty()));
        ON_CALL(*store, location()).WillByDefault(Return("mock"));
    }
};

TEST_F(LedgerServiceSaveFailureTest, SaveFails_MutationKeptAndErrorRaised) {
    LedgerService ledger(store, settings);

    EXPECT_CALL(*store, save(_))
        .WillOnce(Throw(PersistenceIoError("mock", "disk full")));
    EXPECT_THROW(ledger.createAccount("Alice", Money(100)), PersistenceIoError);

    // Счёт создан в памяти, несмотря на ошибку записи
    EXPECT_EQ(ledger.getAccount("ACC-000001").balance(), Money(100));

    EXPECT_CALL(*store, save(_)).WillOnce(Return());
    EXPECT_NO_THROW(ledger.flush());
}

TEST_F(LedgerServiceSaveFailureTest, Dirty_RetriedInDestructor) {
    {
        LedgerService ledger(store, settings);

        EXPECT_CALL(*store, save(_))
            .WillOnce(Throw(PersistenceIoError("mock", "disk full")))
            .WillOnce(Return());
        EXPECT_THROW(ledger.createAccount("Alice"), PersistenceIoError);
    }
    ::testing::Mock::VerifyAndClearExpectations(store.get());
}

TEST_F(LedgerServiceSaveFailureTest, Clean_DestructorDoesNotSave) {
    EXPECT_CALL(*store, save(_)).Times(1);
    {
        LedgerService ledger(store, settings);
        ledger.createAccount("Alice");
    }
}

TEST_F(LedgerServiceSaveFailureTest, LoadIoError_Propagates) {
    EXPECT_CALL(*store, load())
        .WillOnce(Throw(PersistenceIoError("mock", "permission denied")));

    EXPECT_THROW(LedgerService(store, settings), PersistenceIoError);
}
