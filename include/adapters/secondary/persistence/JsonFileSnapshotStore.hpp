#pragma once

#include "ports/output/ISnapshotStore.hpp"
#include <filesystem>
#include <mutex>
#include <string>

namespace ledger::adapters::secondary {

/**
 * @brief Снапшот леджера в JSON-файле
 *
 * Запись идёт во временный файл рядом с целевым, затем rename поверх него,
 * так что читатель никогда не видит наполовину записанный документ.
 * Записи одного экземпляра сериализованы мьютексом.
 */
class JsonFileSnapshotStore : public ports::output::ISnapshotStore {
public:
    explicit JsonFileSnapshotStore(std::filesystem::path path);

    void save(const domain::LedgerState& state) override;
    domain::LedgerState load() override;
    bool exists() const override;
    std::string location() const override;
    void clear() override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;

    std::filesystem::path tempPath() const;
};

} // namespace ledger::adapters::secondary
