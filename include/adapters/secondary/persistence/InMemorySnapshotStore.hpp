#pragma once

#include "ports/output/ISnapshotStore.hpp"
#include "JsonSnapshotCodec.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace ledger::adapters::secondary {

/**
 * @brief Снапшот в памяти
 *
 * Хранит закодированный JSON-документ, поэтому проходит тот же кодек,
 * что и файловое хранилище. Для тестов и леджеров без диска.
 */
class InMemorySnapshotStore : public ports::output::ISnapshotStore {
public:
    InMemorySnapshotStore() = default;

    /**
     * @brief Начать с готового документа (в том числе повреждённого)
     */
    explicit InMemorySnapshotStore(std::string document)
        : document_(std::move(document)) {}

    void save(const domain::LedgerState& state) override {
        auto encoded = JsonSnapshotCodec::encode(state);
        std::lock_guard<std::mutex> lock(mutex_);
        document_ = std::move(encoded);
        ++saveCount_;
    }

    domain::LedgerState load() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!document_) {
            return domain::LedgerState::empty();
        }
        return JsonSnapshotCodec::decode(*document_, location());
    }

    bool exists() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return document_.has_value();
    }

    std::string location() const override {
        return "memory";
    }

    void clear() override {
        std::lock_guard<std::mutex> lock(mutex_);
        document_.reset();
    }

    /**
     * @brief Текущий документ (пустая строка, если снапшота нет)
     */
    std::string document() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return document_.value_or("");
    }

    int saveCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return saveCount_;
    }

private:
    std::optional<std::string> document_;
    int saveCount_ = 0;
    mutable std::mutex mutex_;
};

} // namespace ledger::adapters::secondary
