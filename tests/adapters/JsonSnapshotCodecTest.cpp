#include <gtest/gtest.h>
#include "adapters/secondary/persistence/JsonSnapshotCodec.hpp"
#include "domain/errors/LedgerErrors.hpp"

using namespace ledger::domain;
using ledger::adapters::secondary::JsonSnapshotCodec;

namespace {

LedgerState sampleState() {
    LedgerState state;

    Account alice("ACC-000001", "Alice", Timestamp::fromString("2024-01-15T10:00:00.000000Z"));
    alice.deposit(Money(1000), std::string("Initial deposit"));
    alice.withdraw(Money::fromDouble(99.99));

    Account bob("ACC-000002", "Bob", Timestamp::fromString("2024-01-15T10:05:00.000000Z"));
    bob.deactivate();

    state.accounts.emplace(alice.accountId(), alice);
    state.accounts.emplace(bob.accountId(), bob);
    state.accountCounter = 2;
    return state;
}

} // namespace

// ================================================================
// ENCODE
// ================================================================

TEST(JsonSnapshotCodecTest, ToJson_Layout) {
    auto doc = JsonSnapshotCodec::toJson(sampleState());

    ASSERT_TRUE(doc.contains("accounts"));
    EXPECT_EQ(doc["_account_counter"].get<uint64_t>(), 2u);

    const auto& alice = doc["accounts"]["ACC-000001"];
    EXPECT_EQ(alice["account_id"], "ACC-000001");
    EXPECT_EQ(alice["owner"], "Alice");
    EXPECT_DOUBLE_EQ(alice["balance"].get<double>(), 900.01);
    EXPECT_EQ(alice["created_at"], "2024-01-15T10:00:00.000000Z");
    EXPECT_EQ(alice["_transaction_counter"].get<uint64_t>(), 2u);
    EXPECT_EQ(alice["is_active"], true);

    const auto& txn = alice["transactions"][0];
    EXPECT_EQ(txn["id"], "ACC-000001-TXN-0001");
    EXPECT_EQ(txn["type"], "DEPOSIT");
    EXPECT_DOUBLE_EQ(txn["amount"].get<double>(), 1000.0);
    EXPECT_DOUBLE_EQ(txn["balance_after"].get<double>(), 1000.0);
    EXPECT_EQ(txn["description"], "Initial deposit");

    EXPECT_TRUE(alice["transactions"][1]["description"].is_null());
    EXPECT_EQ(doc["accounts"]["ACC-000002"]["is_active"], false);
}

TEST(JsonSnapshotCodecTest, ToJson_AccountFieldOrder) {
    auto doc = JsonSnapshotCodec::toJson(sampleState());

    std::vector<std::string> keys;
    for (const auto& item : doc["accounts"]["ACC-000001"].items()) {
        keys.push_back(item.key());
    }
    EXPECT_EQ(keys, (std::vector<std::string>{
        "account_id", "owner", "balance", "transactions",
        "created_at", "_transaction_counter", "is_active"}));
}

TEST(JsonSnapshotCodecTest, EncodeDecode_PreservesState) {
    auto original = sampleState();
    auto decoded = JsonSnapshotCodec::decode(JsonSnapshotCodec::encode(original), "test");

    ASSERT_EQ(decoded.accounts.size(), 2u);
    EXPECT_EQ(decoded.accountCounter, 2u);

    const auto& alice = decoded.accounts.at("ACC-000001");
    EXPECT_EQ(alice.balance(), Money::fromDouble(900.01));
    EXPECT_EQ(alice.transactions(), original.accounts.at("ACC-000001").transactions());
    EXPECT_EQ(alice.createdAt(), original.accounts.at("ACC-000001").createdAt());
    EXPECT_FALSE(decoded.accounts.at("ACC-000002").isActive());
}

TEST(JsonSnapshotCodecTest, EncodeDecode_LargeBalance_Exact) {
    LedgerState state;
    Account whale("ACC-000001", "Whale");
    whale.deposit(Money(10000000000, 10000000));
    state.accounts.emplace(whale.accountId(), whale);
    state.accountCounter = 1;

    auto decoded = JsonSnapshotCodec::decode(JsonSnapshotCodec::encode(state), "test");

    const auto& restored = decoded.accounts.at("ACC-000001");
    EXPECT_EQ(restored.balance(), Money(10000000000, 10000000));
    EXPECT_EQ(restored.transactions(), whale.transactions());
}

// ================================================================
// DECODE: LEGACY DOCUMENTS
// ================================================================

TEST(JsonSnapshotCodecTest, Decode_LegacyDocument_DefaultsMissingFields) {
    const std::string legacy = R"({
        "accounts": {
            "ACC-000001": {
                "account_id": "ACC-000001",
                "owner": "Alice",
                "balance": 800.0,
                "transactions": [
                    {"id": "ACC-000001-TXN-0000", "type": "DEPOSIT", "amount": 1000.0,
                     "balance_after": 1000.0, "timestamp": "2024-01-15T10:30:45.123456",
                     "description": "Initial deposit"},
                    {"id": "ACC-000001-TXN-0001", "type": "WITHDRAWAL", "amount": 200.0,
                     "balance_after": 800.0, "timestamp": "2024-01-15T10:31:00.000001",
                     "description": null}
                ],
                "created_at": "2024-01-15T10:30:45.123000"
            }
        }
    })";

    auto state = JsonSnapshotCodec::decode(legacy, "legacy.json");

    EXPECT_EQ(state.accountCounter, 1u);
    const auto& alice = state.accounts.at("ACC-000001");
    EXPECT_TRUE(alice.isActive());
    EXPECT_EQ(alice.transactionCounter(), 2u);
    EXPECT_EQ(alice.balance(), Money(800));
    EXPECT_FALSE(alice.transactions()[1].description.has_value());
}

TEST(JsonSnapshotCodecTest, Decode_EmptyObject_IsEmptyState) {
    auto state = JsonSnapshotCodec::decode("{}", "test");
    EXPECT_TRUE(state.isEmpty());
}

// ================================================================
// DECODE: ERRORS
// ================================================================

TEST(JsonSnapshotCodecTest, Decode_NotJson_Throws) {
    try {
        JsonSnapshotCodec::decode("{ broken", "accounts.json");
        FAIL() << "Expected PersistenceDecodeError";
    } catch (const PersistenceDecodeError& e) {
        EXPECT_EQ(e.location(), "accounts.json");
        EXPECT_EQ(e.kind(), ErrorKind::PERSISTENCE_DECODE_FAILURE);
    }
}

TEST(JsonSnapshotCodecTest, Decode_WrongShapes_Throw) {
    EXPECT_THROW(JsonSnapshotCodec::decode("[]", "t"), PersistenceDecodeError);
    EXPECT_THROW(JsonSnapshotCodec::decode(R"({"accounts": []})", "t"), PersistenceDecodeError);
    EXPECT_THROW(JsonSnapshotCodec::decode(R"({"accounts": {"A": 1}})", "t"), PersistenceDecodeError);
    EXPECT_THROW(JsonSnapshotCodec::decode(R"({"_account_counter": -1})", "t"), PersistenceDecodeError);
}

TEST(JsonSnapshotCodecTest, Decode_KeyMismatch_Throws) {
    const std::string doc = R"({"accounts": {"ACC-000001": {
        "account_id": "ACC-000002", "owner": "X", "balance": 0,
        "transactions": [], "created_at": "2024-01-15T10:30:45"}}})";

    EXPECT_THROW(JsonSnapshotCodec::decode(doc, "t"), PersistenceDecodeError);
}

TEST(JsonSnapshotCodecTest, Decode_BalanceMismatch_Throws) {
    const std::string doc = R"({"accounts": {"ACC-000001": {
        "account_id": "ACC-000001", "owner": "X", "balance": 5.0,
        "transactions": [], "created_at": "2024-01-15T10:30:45"}}})";

    EXPECT_THROW(JsonSnapshotCodec::decode(doc, "t"), PersistenceDecodeError);
}

TEST(JsonSnapshotCodecTest, Decode_UnknownTransactionType_Throws) {
    const std::string doc = R"({"accounts": {"ACC-000001": {
        "account_id": "ACC-000001", "owner": "X", "balance": 5.0,
        "transactions": [{"id": "ACC-000001-TXN-0001", "type": "REFUND", "amount": 5.0,
                          "balance_after": 5.0, "timestamp": "2024-01-15T10:30:45"}],
        "created_at": "2024-01-15T10:30:45"}}})";

    EXPECT_THROW(JsonSnapshotCodec::decode(doc, "t"), PersistenceDecodeError);
}

TEST(JsonSnapshotCodecTest, Decode_AccountCounterBelowCount_Throws) {
    const std::string doc = R"({"_account_counter": 0, "accounts": {"ACC-000001": {
        "account_id": "ACC-000001", "owner": "X", "balance": 0,
        "transactions": [], "created_at": "2024-01-15T10:30:45"}}})";

    EXPECT_THROW(JsonSnapshotCodec::decode(doc, "t"), PersistenceDecodeError);
}

TEST(JsonSnapshotCodecTest, Decode_HugeAmount_Throws) {
    const std::string doc = R"({"accounts": {"ACC-000001": {
        "account_id": "ACC-000001", "owner": "X", "balance": 1e300,
        "transactions": [{"id": "ACC-000001-TXN-0001", "type": "DEPOSIT", "amount": 1e300,
                          "balance_after": 1e300, "timestamp": "2024-01-15T10:30:45"}],
        "created_at": "2024-01-15T10:30:45"}}})";

    EXPECT_THROW(JsonSnapshotCodec::decode(doc, "t"), PersistenceDecodeError);
}
