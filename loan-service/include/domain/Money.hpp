#pragma once

#include <string>
#include <cstdint>
#include <cmath>
#include <ostream>
#include <stdexcept>

namespace loans::domain {

/**
 * @brief Денежная сумма
 *
 * Хранит значение в минорных единицах (центы, копейки) как целое число,
 * поэтому сложение и вычитание балансов точные. Все округления
 * "до 2 знаков" в расчётах по займам означают округление до целого цента.
 */
class Money {
public:
    int64_t cents = 0;

    Money() = default;

    explicit Money(int64_t c) : cents(c) {}

    static Money fromCents(int64_t c) {
        return Money(c);
    }

    /// Предел суммы в валютных единицах, принимаемой из внешнего ввода
    static constexpr double kMaxAbsAmount = 1e13;

    /**
     * @brief Из значения в валютных единицах (округление до цента, half away from zero)
     * @throws std::invalid_argument для NaN, бесконечности и |value| > kMaxAbsAmount
     */
    static Money fromDouble(double value) {
        if (!std::isfinite(value)) {
            throw std::invalid_argument("Amount must be a finite number");
        }
        if (std::fabs(value) > kMaxAbsAmount) {
            throw std::invalid_argument("Amount is out of range: " + std::to_string(value));
        }
        return Money(static_cast<int64_t>(std::llround(value * 100.0)));
    }

    static Money zero() {
        return Money(0);
    }

    double toDouble() const {
        return static_cast<double>(cents) / 100.0;
    }

    /**
     * @brief Умножить на ставку с округлением до цента
     *
     * Используется для процентов: round(balance * periodicRate, 2).
     */
    Money applyRate(double rate) const {
        return Money(static_cast<int64_t>(std::llround(static_cast<double>(cents) * rate)));
    }

    bool isZero() const { return cents == 0; }
    bool isPositive() const { return cents > 0; }
    bool isNegative() const { return cents < 0; }

    /**
     * @brief Строка вида "-1234.05"
     */
    std::string toString() const {
        // через uint64_t: модуль INT64_MIN не помещается в int64_t
        uint64_t absCents = cents < 0 ? 0 - static_cast<uint64_t>(cents) : static_cast<uint64_t>(cents);
        std::string fraction = std::to_string(absCents % 100);
        if (fraction.size() < 2) {
            fraction = "0" + fraction;
        }
        return (cents < 0 ? "-" : "") + std::to_string(absCents / 100) + "." + fraction;
    }

    Money operator+(const Money& other) const {
        return Money(cents + other.cents);
    }

    Money operator-(const Money& other) const {
        return Money(cents - other.cents);
    }

    Money operator-() const {
        return Money(-cents);
    }

    Money operator*(int64_t multiplier) const {
        return Money(cents * multiplier);
    }

    Money& operator+=(const Money& other) {
        cents += other.cents;
        return *this;
    }

    Money& operator-=(const Money& other) {
        cents -= other.cents;
        return *this;
    }

    bool operator<(const Money& other) const { return cents < other.cents; }
    bool operator>(const Money& other) const { return cents > other.cents; }
    bool operator<=(const Money& other) const { return cents <= other.cents; }
    bool operator>=(const Money& other) const { return cents >= other.cents; }
    bool operator==(const Money& other) const { return cents == other.cents; }
    bool operator!=(const Money& other) const { return cents != other.cents; }
};

inline std::ostream& operator<<(std::ostream& os, const Money& money) {
    return os << money.toString();
}

} // namespace loans::domain
