#pragma once

#include <string>
#include <cctype>
#include <cstdint>
#include <cmath>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace ledger::domain {

/**
 * @brief Денежная сумма с точной десятичной арифметикой
 *
 * Хранит целую часть и дробную часть в нано-единицах (10^-9).
 * Инвариант после любой операции: 0 <= nano < 1'000'000'000,
 * отрицательные значения представлены через units (например, -0.5 = {-1, 500000000}).
 */
class Money {
public:
    static constexpr int32_t NANO_PER_UNIT = 1000000000;

    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)

    Money() = default;

    explicit Money(int64_t u, int32_t n = 0) : units(u), nano(n) {
        normalize();
    }

    static Money zero() {
        return Money();
    }

    /**
     * @brief Создать из double с округлением до ближайшей нано-единицы
     */
    static Money fromDouble(double value) {
        // -2^63 и 2^63 представимы в double точно
        constexpr double lowest = static_cast<double>(std::numeric_limits<int64_t>::min());
        if (!std::isfinite(value) || value < lowest || value >= -lowest) {
            throw std::invalid_argument("Amount out of range: " + std::to_string(value));
        }

        const double whole = std::floor(value);
        Money m;
        m.units = static_cast<int64_t>(whole);
        m.nano = static_cast<int32_t>(std::llround((value - whole) * 1e9));
        m.normalize();
        return m;
    }

    /**
     * @brief Разобрать десятичную запись числа без потери точности
     *
     * Принимает JSON-числа: "-12.5", "1000", "1.5e-05", "1e+300".
     * Цифры после 9-го знака дробной части округляются (половина - от нуля).
     *
     * @throws std::invalid_argument если строка не число или не помещается в int64
     */
    static Money fromDecimalString(const std::string& text) {
        std::size_t pos = 0;
        bool negative = false;
        if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
            negative = text[pos] == '-';
            ++pos;
        }

        std::string digits;
        long fractionDigits = 0;
        bool seenPoint = false;
        for (; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (std::isdigit(static_cast<unsigned char>(c))) {
                digits.push_back(c);
                if (seenPoint) {
                    ++fractionDigits;
                }
            } else if (c == '.' && !seenPoint) {
                seenPoint = true;
            } else {
                break;
            }
        }
        if (digits.empty()) {
            throw std::invalid_argument("Invalid amount: " + text);
        }

        long exponent = 0;
        if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
            ++pos;
            bool negativeExponent = false;
            if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
                negativeExponent = text[pos] == '-';
                ++pos;
            }
            const std::size_t start = pos;
            for (; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
                if (exponent < 100000) {
                    exponent = exponent * 10 + (text[pos] - '0');
                }
            }
            if (pos == start) {
                throw std::invalid_argument("Invalid amount: " + text);
            }
            if (negativeExponent) {
                exponent = -exponent;
            }
        }
        if (pos != text.size()) {
            throw std::invalid_argument("Invalid amount: " + text);
        }

        const std::size_t firstNonZero = digits.find_first_not_of('0');
        if (firstNonZero == std::string::npos) {
            return Money();
        }
        digits.erase(0, firstNonZero);

        // Позиция десятичной точки относительно начала digits
        const long intLength = static_cast<long>(digits.size()) + exponent - fractionDigits;
        if (intLength > 19) {
            throw std::invalid_argument("Amount out of range: " + text);
        }

        std::string intPart;
        std::string fracPart;
        if (intLength <= 0) {
            if (intLength < -10) {
                return Money();
            }
            fracPart = std::string(static_cast<std::size_t>(-intLength), '0') + digits;
        } else if (static_cast<std::size_t>(intLength) >= digits.size()) {
            intPart = digits + std::string(static_cast<std::size_t>(intLength) - digits.size(), '0');
        } else {
            intPart = digits.substr(0, static_cast<std::size_t>(intLength));
            fracPart = digits.substr(static_cast<std::size_t>(intLength));
        }

        constexpr int64_t maxUnits = std::numeric_limits<int64_t>::max();
        int64_t whole = 0;
        for (char c : intPart) {
            const int digit = c - '0';
            if (whole > (maxUnits - digit) / 10) {
                throw std::invalid_argument("Amount out of range: " + text);
            }
            whole = whole * 10 + digit;
        }

        fracPart.resize(10, '0');
        int64_t fraction = std::stoll(fracPart.substr(0, 9));
        if (fracPart[9] >= '5') {
            ++fraction;
        }
        if (fraction == NANO_PER_UNIT) {
            if (whole == maxUnits) {
                throw std::invalid_argument("Amount out of range: " + text);
            }
            ++whole;
            fraction = 0;
        }

        Money m(whole, static_cast<int32_t>(fraction));
        return negative ? m.negated() : m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isZero() const { return units == 0 && nano == 0; }
    bool isPositive() const { return units > 0 || (units == 0 && nano > 0); }
    bool isNegative() const { return units < 0; }

    Money negated() const {
        if (nano == 0) {
            return Money(-units, 0);
        }
        return Money(-units - 1, NANO_PER_UNIT - nano);
    }

    Money operator+(const Money& other) const {
        return Money(units + other.units, nano + other.nano);
    }

    Money operator-(const Money& other) const {
        return Money(units - other.units, nano - other.nano);
    }

    Money& operator+=(const Money& other) {
        *this = *this + other;
        return *this;
    }

    Money& operator-=(const Money& other) {
        *this = *this - other;
        return *this;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano;
    }
    bool operator!=(const Money& other) const { return !(*this == other); }
    bool operator<(const Money& other) const {
        return std::tie(units, nano) < std::tie(other.units, other.nano);
    }
    bool operator>(const Money& other) const { return other < *this; }
    bool operator<=(const Money& other) const { return !(other < *this); }
    bool operator>=(const Money& other) const { return !(*this < other); }

    /**
     * @brief Строка с двумя знаками после запятой ("1234.50")
     *
     * Округление половины - от нуля.
     */
    std::string toString() const {
        if (isNegative()) {
            return "-" + negated().toString();
        }

        int64_t whole = units;
        int64_t cents = (static_cast<int64_t>(nano) + 5000000) / 10000000;
        if (cents == 100) {
            ++whole;
            cents = 0;
        }

        std::ostringstream ss;
        ss << whole << '.' << std::setw(2) << std::setfill('0') << cents;
        return ss.str();
    }

    /**
     * @brief Строка для вывода пользователю ("$1234.50")
     */
    std::string toDisplayString() const {
        if (isNegative()) {
            return "-$" + negated().toString();
        }
        return "$" + toString();
    }

private:
    void normalize() {
        units += nano / NANO_PER_UNIT;
        nano %= NANO_PER_UNIT;
        if (nano < 0) {
            --units;
            nano += NANO_PER_UNIT;
        }
    }
};

inline std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.toString();
}

} // namespace ledger::domain
