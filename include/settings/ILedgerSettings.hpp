#pragma once

#include <cstddef>
#include <string>

namespace ledger::settings {

/**
 * @brief Интерфейс настроек леджера
 */
class ILedgerSettings {
public:
    virtual ~ILedgerSettings() = default;

    /**
     * @brief Путь к JSON-файлу снапшота
     */
    virtual std::string getDataFile() const = 0;

    /**
     * @brief Сколько последних операций показывать в выписке
     */
    virtual std::size_t getStatementLimit() const = 0;

    /**
     * @brief Падать ли при повреждённом снапшоте
     *
     * false - предупреждение в лог и старт с пустым леджером.
     */
    virtual bool isStrictLoad() const = 0;
};

} // namespace ledger::settings
