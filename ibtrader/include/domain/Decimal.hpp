#pragma once

#include <cstdint>
#include <string>

namespace ibtrader::domain {

/**
 * @brief Десятичное число с фиксированной точкой
 *
 * Используется для цен, процентов и денежных сумм. Представление как у
 * Money в брокерских API:
 * - units: целая часть
 * - nano: дробная часть (10^-9), знак совпадает со знаком units
 *
 * Пример: 3.05 = {units: 3, nano: 50000000}
 *
 * Все операции целочисленные, поэтому результат не зависит от
 * порядка и количества вызовов.
 */
struct Decimal {
    static constexpr int64_t NANO_SCALE = 1000000000;

    int64_t units = 0;          ///< Целая часть
    int32_t nano = 0;           ///< Дробная часть (10^-9)

    Decimal() = default;

    Decimal(int64_t u, int32_t n) : units(u), nano(n) {}

    /**
     * @brief Создать из общего количества нано-единиц
     */
    static Decimal fromNanos(int64_t nanos) {
        return Decimal(nanos / NANO_SCALE, static_cast<int32_t>(nanos % NANO_SCALE));
    }

    /**
     * @brief Общее количество нано-единиц
     */
    int64_t toNanos() const {
        return units * NANO_SCALE + nano;
    }

    /**
     * @brief Разобрать строку вида "3", "-0.05", "12.5"
     * @throws std::invalid_argument если строка не является числом
     *         или содержит больше 9 знаков после точки
     */
    static Decimal fromString(const std::string& text);

    /**
     * @brief Создать из double с округлением до нано-единиц
     *
     * Только для значений, которые брокер передаёт как double.
     */
    static Decimal fromDouble(double value);

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    /**
     * @brief Строка без лишних нулей, минимум два знака после точки ("3.90")
     */
    std::string toString() const;

    Decimal operator+(const Decimal& other) const {
        return fromNanos(toNanos() + other.toNanos());
    }

    Decimal operator-(const Decimal& other) const {
        return fromNanos(toNanos() - other.toNanos());
    }

    Decimal operator-() const {
        return fromNanos(-toNanos());
    }

    /**
     * @brief Умножение на количество
     */
    Decimal operator*(int64_t qty) const {
        return fromNanos(toNanos() * qty);
    }

    /**
     * @brief Деление на целое с округлением половины от нуля
     * @throws std::invalid_argument при делении на ноль
     */
    Decimal dividedBy(int64_t divisor) const;

    /**
     * @brief Округлить вниз до кратного шагу
     * @throws std::invalid_argument если шаг не положительный
     */
    Decimal floorTo(const Decimal& increment) const;

    /**
     * @brief Округлить вверх до кратного шагу
     * @throws std::invalid_argument если шаг не положительный
     */
    Decimal ceilTo(const Decimal& increment) const;

    bool operator==(const Decimal& other) const {
        return toNanos() == other.toNanos();
    }

    bool operator!=(const Decimal& other) const {
        return !(*this == other);
    }

    bool operator<(const Decimal& other) const {
        return toNanos() < other.toNanos();
    }

    bool operator>(const Decimal& other) const {
        return other < *this;
    }

    bool operator<=(const Decimal& other) const {
        return !(other < *this);
    }

    bool operator>=(const Decimal& other) const {
        return !(*this < other);
    }

    bool isZero() const {
        return units == 0 && nano == 0;
    }

    bool isNegative() const {
        return toNanos() < 0;
    }

    bool isPositive() const {
        return toNanos() > 0;
    }

    Decimal abs() const {
        return isNegative() ? -*this : *this;
    }
};

} // namespace ibtrader::domain
