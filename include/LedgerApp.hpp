#pragma once

#include <memory>

// Forward declarations - Ports
namespace ledger::ports::input {
    class ILedgerService;
}

namespace ledger::settings {
    class ILedgerSettings;
}

/**
 * @class LedgerApp
 * @brief Демо-приложение леджера
 *
 * Template Method:
 * 1. loadEnvironment() - настройки из ENV и аргументов
 * 2. configureInjection() - Boost.DI: settings, snapshot store, ledger
 * 3. start() - сценарий: счета, операции, перевод, выписки, сводка
 *
 * Повторный запуск подхватывает accounts.json и показывает сохранённое состояние.
 */
class LedgerApp
{
public:
    LedgerApp();
    ~LedgerApp();

    /**
     * @brief Запустить приложение
     * @return Код выхода процесса
     */
    int run(int argc, char* argv[]);

protected:
    void loadEnvironment(int argc, char* argv[]);
    void configureInjection();
    void start();

private:
    std::shared_ptr<ledger::settings::ILedgerSettings> settings_;
    std::shared_ptr<ledger::ports::input::ILedgerService> ledger_;
    bool reset_ = false;

    void runFreshScenario();
    void runErrorScenario();
    void printStartupBanner();
};
