#include "adapters/secondary/persistence/JsonSnapshotCodec.hpp"
#include "domain/errors/LedgerErrors.hpp"
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ledger::adapters::secondary {

namespace {

using Json = nlohmann::ordered_json;

const Json& require(const Json& object, const char* key, const std::string& context) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw std::invalid_argument(std::string("missing \"") + key + "\" in " + context);
    }
    return *it;
}

std::string readString(const Json& object, const char* key, const std::string& context) {
    const auto& value = require(object, key, context);
    if (!value.is_string()) {
        throw std::invalid_argument(std::string("\"") + key + "\" is not a string in " + context);
    }
    return value.get<std::string>();
}

domain::Money readMoney(const Json& object, const char* key, const std::string& context) {
    const auto& value = require(object, key, context);
    if (!value.is_number()) {
        throw std::invalid_argument(std::string("\"") + key + "\" is not a number in " + context);
    }
    // Кратчайшая запись числа в JSON точно восстанавливает сохранённые центы
    return domain::Money::fromDecimalString(value.dump());
}

domain::Timestamp readTimestamp(const Json& object, const char* key, const std::string& context) {
    return domain::Timestamp::fromString(readString(object, key, context));
}

uint64_t readCounter(const Json& object, const char* key, uint64_t fallback,
                     const std::string& context) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_unsigned()) {
        throw std::invalid_argument(std::string("\"") + key +
                                    "\" is not a non-negative integer in " + context);
    }
    return it->get<uint64_t>();
}

Json transactionToJson(const domain::Transaction& txn) {
    Json j;
    j["id"] = txn.id;
    j["type"] = domain::toString(txn.type);
    j["amount"] = txn.amount.toDouble();
    j["balance_after"] = txn.balanceAfter.toDouble();
    j["timestamp"] = txn.timestamp.toString();
    j["description"] = txn.description ? Json(*txn.description) : Json(nullptr);
    return j;
}

domain::Transaction transactionFromJson(const Json& j, const std::string& context) {
    if (!j.is_object()) {
        throw std::invalid_argument("transaction entry is not an object in " + context);
    }

    domain::Transaction txn;
    txn.id = readString(j, "id", context);

    const std::string txnContext = "transaction " + txn.id;
    txn.type = domain::transactionTypeFromString(readString(j, "type", txnContext));
    txn.amount = readMoney(j, "amount", txnContext);
    txn.balanceAfter = readMoney(j, "balance_after", txnContext);
    txn.timestamp = readTimestamp(j, "timestamp", txnContext);

    auto description = j.find("description");
    if (description != j.end() && !description->is_null()) {
        if (!description->is_string()) {
            throw std::invalid_argument("\"description\" is not a string in " + txnContext);
        }
        txn.description = description->get<std::string>();
    }
    return txn;
}

Json accountToJson(const domain::Account& account) {
    Json transactions = Json::array();
    for (const auto& txn : account.transactions()) {
        transactions.push_back(transactionToJson(txn));
    }

    Json j;
    j["account_id"] = account.accountId();
    j["owner"] = account.owner();
    j["balance"] = account.balance().toDouble();
    j["transactions"] = std::move(transactions);
    j["created_at"] = account.createdAt().toString();
    j["_transaction_counter"] = account.transactionCounter();
    j["is_active"] = account.isActive();
    return j;
}

domain::Account accountFromJson(const std::string& key, const Json& j) {
    const std::string context = "account " + key;
    if (!j.is_object()) {
        throw std::invalid_argument(context + " is not an object");
    }

    const std::string accountId = readString(j, "account_id", context);
    if (accountId != key) {
        throw std::invalid_argument("key " + key + " holds account_id " + accountId);
    }

    const auto& transactionsJson = require(j, "transactions", context);
    if (!transactionsJson.is_array()) {
        throw std::invalid_argument("\"transactions\" is not an array in " + context);
    }

    std::vector<domain::Transaction> transactions;
    transactions.reserve(transactionsJson.size());
    for (const auto& item : transactionsJson) {
        transactions.push_back(transactionFromJson(item, context));
    }

    bool active = true;
    auto activeIt = j.find("is_active");
    if (activeIt != j.end() && !activeIt->is_null()) {
        if (!activeIt->is_boolean()) {
            throw std::invalid_argument("\"is_active\" is not a boolean in " + context);
        }
        active = activeIt->get<bool>();
    }

    const uint64_t counter = readCounter(j, "_transaction_counter", transactions.size(), context);

    return domain::Account::restore(
        accountId,
        readString(j, "owner", context),
        readMoney(j, "balance", context),
        active,
        std::move(transactions),
        readTimestamp(j, "created_at", context),
        counter
    );
}

} // namespace

nlohmann::ordered_json JsonSnapshotCodec::toJson(const domain::LedgerState& state) {
    Json accounts = Json::object();
    for (const auto& [id, account] : state.accounts) {
        accounts[id] = accountToJson(account);
    }

    Json document;
    document["accounts"] = std::move(accounts);
    document["_account_counter"] = state.accountCounter;
    return document;
}

domain::LedgerState JsonSnapshotCodec::fromJson(const nlohmann::ordered_json& document,
                                                const std::string& source) {
    try {
        if (!document.is_object()) {
            throw std::invalid_argument("document is not a JSON object");
        }

        domain::LedgerState state;

        auto accounts = document.find("accounts");
        if (accounts != document.end()) {
            if (!accounts->is_object()) {
                throw std::invalid_argument("\"accounts\" is not an object");
            }
            for (const auto& [key, value] : accounts->items()) {
                state.accounts.emplace(key, accountFromJson(key, value));
            }
        }

        state.accountCounter = readCounter(document, "_account_counter",
                                           state.accounts.size(), "document");
        if (state.accountCounter < state.accounts.size()) {
            throw std::invalid_argument("\"_account_counter\" is below the number of accounts");
        }
        return state;

    } catch (const nlohmann::json::exception& e) {
        throw domain::PersistenceDecodeError(source, e.what());
    } catch (const std::invalid_argument& e) {
        throw domain::PersistenceDecodeError(source, e.what());
    }
}

std::string JsonSnapshotCodec::encode(const domain::LedgerState& state, int indent) {
    return toJson(state).dump(indent, ' ', false, Json::error_handler_t::replace);
}

domain::LedgerState JsonSnapshotCodec::decode(const std::string& content, const std::string& source) {
    Json document;
    try {
        document = Json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw domain::PersistenceDecodeError(source, e.what());
    }
    return fromJson(document, source);
}

} // namespace ledger::adapters::secondary
