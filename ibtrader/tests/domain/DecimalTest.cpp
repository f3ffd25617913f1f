/**
 * @file DecimalTest.cpp
 * @brief Тесты Decimal: разбор, форматирование, округление к шагу
 */

#include <gtest/gtest.h>
#include "domain/Decimal.hpp"
#include <stdexcept>

using namespace ibtrader::domain;

class DecimalTest : public ::testing::Test {};

TEST_F(DecimalTest, FromString_WholeAndFraction_ParsesExactly) {
    auto value = Decimal::fromString("3.05");
    EXPECT_EQ(value.units, 3);
    EXPECT_EQ(value.nano, 50000000);
}

TEST_F(DecimalTest, FromString_Negative_KeepsSign) {
    auto value = Decimal::fromString("-1.5");
    EXPECT_TRUE(value.isNegative());
    EXPECT_EQ(value.toNanos(), -1500000000);
}

TEST_F(DecimalTest, FromString_Garbage_Throws) {
    EXPECT_THROW(Decimal::fromString("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString(""), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("1.2.3"), std::invalid_argument);
}

TEST_F(DecimalTest, FromString_TooManyFractionDigits_Throws) {
    EXPECT_THROW(Decimal::fromString("0.1234567891"), std::invalid_argument);
}

TEST_F(DecimalTest, ToString_TrimsToTwoDigits) {
    EXPECT_EQ(Decimal::fromString("450").toString(), "450.00");
    EXPECT_EQ(Decimal::fromString("2.4").toString(), "2.40");
    EXPECT_EQ(Decimal::fromString("0.125").toString(), "0.125");
    EXPECT_EQ(Decimal::fromString("-0.5").toString(), "-0.50");
}

TEST_F(DecimalTest, Arithmetic_NoFloatingPointDrift) {
    auto sum = Decimal::fromString("0.1") + Decimal::fromString("0.2");
    EXPECT_EQ(sum, Decimal::fromString("0.3"));
    EXPECT_EQ(Decimal::fromString("1.25") * 4, Decimal(5, 0));
}

TEST_F(DecimalTest, DividedBy_RoundsHalfAwayFromZero) {
    EXPECT_EQ(Decimal::fromNanos(5).dividedBy(2), Decimal::fromNanos(3));
    EXPECT_EQ(Decimal::fromNanos(-5).dividedBy(2), Decimal::fromNanos(-3));
    EXPECT_EQ(Decimal(10, 0).dividedBy(4), Decimal::fromString("2.5"));
}

TEST_F(DecimalTest, DividedBy_Zero_Throws) {
    EXPECT_THROW(Decimal(1, 0).dividedBy(0), std::invalid_argument);
}

TEST_F(DecimalTest, FloorTo_AndCeilTo_SnapToIncrement) {
    auto tick = Decimal::fromString("0.05");
    EXPECT_EQ(Decimal::fromString("2.43").floorTo(tick), Decimal::fromString("2.40"));
    EXPECT_EQ(Decimal::fromString("2.43").ceilTo(tick), Decimal::fromString("2.45"));
    EXPECT_EQ(Decimal::fromString("2.45").floorTo(tick), Decimal::fromString("2.45"));
    EXPECT_EQ(Decimal::fromString("-0.01").floorTo(tick), Decimal::fromString("-0.05"));
}

TEST_F(DecimalTest, Comparison_OrdersByValue) {
    EXPECT_LT(Decimal::fromString("2.99"), Decimal(3, 0));
    EXPECT_GE(Decimal(3, 0), Decimal::fromString("3.00"));
    EXPECT_EQ(Decimal::fromString("-2").abs(), Decimal(2, 0));
}
