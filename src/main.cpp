#include "LedgerApp.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    try
    {
        LedgerApp app;

        std::cout << "========================================" << std::endl;
        std::cout << "  Ledger Demo Starting" << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << std::endl;

        // Template Method:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. start()
        const int code = app.run(argc, argv);

        std::cout << "\n========================================" << std::endl;
        std::cout << "  Ledger Demo Stopped" << std::endl;
        std::cout << "========================================" << std::endl;

        return code;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
