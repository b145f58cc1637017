#include "LedgerApp.hpp"

// Application Services
#include "application/LedgerService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/JsonFileSnapshotStore.hpp"

// Settings
#include "settings/LedgerSettings.hpp"

#include "domain/errors/LedgerErrors.hpp"

#include <boost/di.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace di = boost::di;

using ledger::domain::Money;

LedgerApp::LedgerApp()
{
    std::cout << "[LedgerApp] Application created" << std::endl;
}

LedgerApp::~LedgerApp()
{
    std::cout << "[LedgerApp] Application destroyed" << std::endl;
}

int LedgerApp::run(int argc, char* argv[])
{
    loadEnvironment(argc, argv);
    configureInjection();
    start();
    return 0;
}

void LedgerApp::loadEnvironment(int argc, char* argv[])
{
    std::cout << "[LedgerApp] Loading environment..." << std::endl;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--reset")
        {
            reset_ = true;
        }
        else
        {
            throw std::invalid_argument("Unknown argument: " + arg + " (usage: ledger-demo [--reset])");
        }
    }

    settings_ = std::make_shared<ledger::settings::LedgerSettings>();

    std::cout << "[LedgerApp] Data file: " << settings_->getDataFile() << std::endl;
    std::cout << "[LedgerApp] Statement limit: " << settings_->getStatementLimit() << std::endl;
    std::cout << "[LedgerApp] Strict load: " << (settings_->isStrictLoad() ? "yes" : "no") << std::endl;
}

void LedgerApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[LedgerApp] Configuring Boost.DI injection..." << std::endl;

    auto store = std::make_shared<ledger::adapters::secondary::JsonFileSnapshotStore>(
        settings_->getDataFile());
    if (reset_)
    {
        std::cout << "[LedgerApp] --reset: removing " << store->location() << std::endl;
        store->clear();
    }

    auto injector = di::make_injector(

        // ILedgerSettings - ENV
        di::bind<ledger::settings::ILedgerSettings>().to(settings_),

        // ISnapshotStore - JSON файл
        di::bind<ledger::ports::output::ISnapshotStore>().to(store),

        // ILedgerService ← LedgerService(ISnapshotStore, ILedgerSettings)
        di::bind<ledger::ports::input::ILedgerService>()
            .to<ledger::application::LedgerService>()
            .in(di::singleton));

    ledger_ = injector.create<std::shared_ptr<ledger::ports::input::ILedgerService>>();

    std::cout << "[LedgerApp] Injector configured (3 bindings)" << std::endl;
}

void LedgerApp::start()
{
    auto accounts = ledger_->listAccounts();
    if (accounts.empty())
    {
        std::cout << "\n-> No existing data, creating new accounts..." << std::endl;
        runFreshScenario();
    }
    else
    {
        std::cout << "\n-> Loaded " << accounts.size() << " existing accounts from "
                  << settings_->getDataFile() << std::endl;
    }

    std::cout << "\n" << ledger_->getSummary() << std::endl;

    runErrorScenario();

    auto stats = ledger_->getStats();
    std::cout << "\nAccounts: " << stats.totalAccounts
              << " (active: " << stats.activeAccounts
              << ", inactive: " << stats.inactiveAccounts << ")" << std::endl;
    std::cout << "Transactions: " << stats.totalTransactions << std::endl;
    std::cout << "Total balance: " << stats.totalBalance.toDisplayString() << std::endl;

    std::cout << "\nData saved to: " << settings_->getDataFile() << std::endl;
    std::cout << "Run again to see persistence, or pass --reset to start over." << std::endl;
}

void LedgerApp::runFreshScenario()
{
    auto alice = ledger_->createAccount("Alice", Money(1000));
    auto bob = ledger_->createAccount("Bob", Money(500));

    ledger_->deposit(alice.accountId(), Money(250), std::string("Salary bonus"));
    ledger_->withdraw(alice.accountId(), Money(100), std::string("Groceries"));
    ledger_->transfer(alice.accountId(), bob.accountId(), Money(200), std::string("Rent payment"));

    std::cout << "\n" << ledger_->getStatement(alice.accountId()) << std::endl;
    std::cout << "\n" << ledger_->getStatement(bob.accountId()) << std::endl;
}

void LedgerApp::runErrorScenario()
{
    std::cout << "\n========================================" << std::endl;
    std::cout << "  Error handling" << std::endl;
    std::cout << "========================================" << std::endl;

    auto accounts = ledger_->listAccounts();
    if (accounts.size() >= 2)
    {
        std::cout << "\n[1] Transfer more than the balance..." << std::endl;
        ledger::domain::TransferRequest request;
        request.fromAccountId = accounts[0].accountId();
        request.toAccountId = accounts[1].accountId();
        request.amount = accounts[0].balance() + Money(5000);

        auto result = ledger_->tryTransfer(request);
        std::cout << "  " << ledger::domain::toString(result.status) << ": " << result.message << std::endl;
    }

    std::cout << "\n[2] Look up a non-existent account..." << std::endl;
    try
    {
        ledger_->getAccount("INVALID-123");
    }
    catch (const ledger::domain::AccountNotFoundError& e)
    {
        std::cout << "  Caught: " << e.what() << std::endl;
    }

    if (!accounts.empty())
    {
        std::cout << "\n[3] Deposit a negative amount..." << std::endl;
        try
        {
            ledger_->deposit(accounts[0].accountId(), Money::fromDouble(-50.0));
        }
        catch (const ledger::domain::LedgerException& e)
        {
            std::cout << "  Caught: " << e.what() << std::endl;
        }
    }
}

void LedgerApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Ledger Demo" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "  Architecture: Hexagonal (Ports & Adapters)" << std::endl;
    std::cout << "  Snapshot: " << settings_->getDataFile() << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;
}
