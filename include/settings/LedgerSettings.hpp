#pragma once

#include "ILedgerSettings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace ledger::settings {

/**
 * @brief Настройки леджера из переменных окружения
 *
 * Читает из ENV:
 * - LEDGER_DATA_FILE (default: accounts.json)
 * - LEDGER_STATEMENT_LIMIT (default: 10)
 * - LEDGER_STRICT_LOAD (default: false)
 */
class LedgerSettings : public ILedgerSettings {
public:
    LedgerSettings() {
        dataFile_ = getEnvOrDefault("LEDGER_DATA_FILE", "accounts.json");

        const char* limitValue = std::getenv("LEDGER_STATEMENT_LIMIT");
        if (limitValue && *limitValue) {
            const std::string val(limitValue);
            std::size_t parsed = 0;
            long limit = 0;
            try {
                limit = std::stol(val, &parsed);
            } catch (const std::exception&) {
                parsed = 0;
            }
            if (parsed != val.size()) {
                throw std::invalid_argument("LEDGER_STATEMENT_LIMIT is not a number: " + val);
            }
            if (limit <= 0) {
                throw std::invalid_argument(
                    "LEDGER_STATEMENT_LIMIT must be positive: " + val);
            }
            statementLimit_ = static_cast<std::size_t>(limit);
        }

        const char* strictValue = std::getenv("LEDGER_STRICT_LOAD");
        if (strictValue && *strictValue) {
            strictLoad_ = parseBool(strictValue);
        }
    }

    std::string getDataFile() const override { return dataFile_; }
    std::size_t getStatementLimit() const override { return statementLimit_; }
    bool isStrictLoad() const override { return strictLoad_; }

private:
    std::string dataFile_;
    std::size_t statementLimit_ = 10;
    bool strictLoad_ = false;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return (value && *value) ? std::string(value) : std::string(defaultValue);
    }

    static bool parseBool(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value == "1" || value == "true" || value == "yes" || value == "on";
    }
};

} // namespace ledger::settings
