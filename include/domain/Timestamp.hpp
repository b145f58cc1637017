#pragma once

#include <string>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace ledger::domain {

/**
 * @brief Временная метка UTC с точностью до микросекунд
 *
 * Сериализуется в ISO 8601: "2025-12-16T10:30:00.123456Z".
 * Точность ограничена микросекундами, чтобы запись и чтение снапшота
 * давали одно и то же значение.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    /**
     * @brief Создать Timestamp с текущим временем
     */
    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Разобрать ISO 8601 строку
     *
     * Принимает "YYYY-MM-DDTHH:MM:SS", опционально с дробной частью секунд
     * (до 6 цифр учитываются) и суффиксом "Z" или "+00:00".
     * Строка без зоны считается UTC.
     *
     * @throws std::invalid_argument если строка не распознана
     */
    static Timestamp fromString(const std::string& isoString) {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
        int consumed = 0;
        if (std::sscanf(isoString.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &year, &month, &day, &hour, &minute, &second, &consumed) != 6
            || consumed != 19) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }
        if (month < 1 || month > 12 || day < 1 || day > 31 ||
            hour > 23 || minute > 59 || second > 60) {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
        }

        std::size_t pos = static_cast<std::size_t>(consumed);
        int64_t micros = 0;
        if (pos < isoString.size() && isoString[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < isoString.size() && std::isdigit(static_cast<unsigned char>(isoString[pos]))) {
                if (digits < 6) {
                    micros = micros * 10 + (isoString[pos] - '0');
                }
                ++digits;
                ++pos;
            }
            if (digits == 0) {
                throw std::invalid_argument("Invalid ISO 8601 timestamp: " + isoString);
            }
            for (; digits < 6; ++digits) {
                micros *= 10;
            }
        }

        const std::string zone = isoString.substr(pos);
        if (!zone.empty() && zone != "Z" && zone != "+00:00") {
            throw std::invalid_argument("Unsupported timezone in timestamp: " + isoString);
        }

        const int64_t seconds = daysFromCivil(year, month, day) * 86400
                              + hour * 3600 + minute * 60 + second;
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(seconds) + std::chrono::microseconds(micros))));
    }

    /**
     * @brief Преобразовать в ISO 8601 строку с микросекундами
     */
    std::string toString() const {
        const int64_t micros = toUnixMicros();
        int64_t seconds = micros / 1000000;
        int64_t fraction = micros % 1000000;
        if (fraction < 0) {
            fraction += 1000000;
            --seconds;
        }

        char buffer[40];
        std::snprintf(buffer, sizeof(buffer), "%s.%06lldZ",
                      formatUnix(seconds, "%Y-%m-%dT%H:%M:%S").c_str(),
                      static_cast<long long>(fraction));
        return buffer;
    }

    /**
     * @brief Форматировать через strftime (UTC)
     */
    std::string format(const char* pattern) const {
        return formatUnix(toUnixSeconds(), pattern);
    }

    /**
     * @brief Получить Unix timestamp (секунды с 1970)
     */
    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    int64_t toUnixMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            value.time_since_epoch()
        ).count();
    }

    /**
     * @brief Создать из Unix timestamp
     */
    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
    }

    static std::string formatUnix(int64_t unixSeconds, const char* pattern) {
        std::time_t t = static_cast<std::time_t>(unixSeconds);
        std::tm tm{};
        gmtime_r(&t, &tm);

        char buffer[64];
        const std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &tm);
        return std::string(buffer, written);
    }

    // Количество дней от 1970-01-01 (алгоритм Howard Hinnant, пролептический григорианский календарь)
    static int64_t daysFromCivil(int64_t y, int64_t m, int64_t d) {
        y -= m <= 2 ? 1 : 0;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const int64_t yoe = y - era * 400;
        const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + doe - 719468;
    }
};

} // namespace ledger::domain
