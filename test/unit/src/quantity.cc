#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "quantity.hh"

using ProfileBundle::Decimal;
using ProfileBundle::Quantity;
using ProfileBundle::RelativeAdjustment;
using ProfileBundle::Unit;

namespace QuantityCheck {
  // Applies 'expression' to 'value' and formats the result
  inline std::string adjust(const std::string &value, const std::string &expression)
  {
    return RelativeAdjustment::parse(expression).apply(Quantity::parse(value)).toString();
  }

  TEST(QuantityCheck, decimal_parse_and_format)
  {
    EXPECT_EQ(Decimal::parse("0.2").toString(false), "0.2");
    EXPECT_EQ(Decimal::parse("15").toString(false), "15");
    EXPECT_EQ(Decimal::parse("15").toString(true), "15.0");
    EXPECT_EQ(Decimal::parse(".5").toString(false), "0.5");
    EXPECT_EQ(Decimal::parse("-1.250").toString(false), "-1.25");
    EXPECT_EQ(Decimal::parse("0.000001").units(), 1);
  }

  TEST(QuantityCheck, decimal_is_exact)
  {
    auto sum = Decimal::parse("0.1") + Decimal::parse("0.2");

    EXPECT_EQ(sum, Decimal::parse("0.3"));
    EXPECT_EQ(sum.toString(false), "0.3");
    EXPECT_TRUE((Decimal::parse("1") - Decimal::parse("2")).isNegative());
    EXPECT_LT(Decimal::parse("0.15"), Decimal::parse("0.2"));
  }

  TEST(QuantityCheck, decimal_rejects_malformed_text)
  {
    EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("1234567890123"), std::invalid_argument);
    EXPECT_THROW(Decimal::parse("0.1234567"), std::invalid_argument);
  }

  TEST(QuantityCheck, quantity_units)
  {
    auto percent = Quantity::parse("15%");
    EXPECT_EQ(percent.unit, Unit::Percent);
    EXPECT_TRUE(percent.integral);
    EXPECT_EQ(percent.toString(), "15%");

    auto millimeter = Quantity::parse(" 0.4mm ");
    EXPECT_EQ(millimeter.unit, Unit::Millimeter);
    EXPECT_FALSE(millimeter.integral);
    EXPECT_EQ(millimeter.toString(), "0.4mm");

    EXPECT_EQ(Quantity::parse("0.20").toString(), "0.2");
    EXPECT_EQ(Quantity::parse("3").unit, Unit::None);

    EXPECT_THROW(Quantity::parse("abc"), std::invalid_argument);
    EXPECT_THROW(Quantity::parse("10cm"), std::invalid_argument);
    EXPECT_THROW(Quantity::parse("%"), std::invalid_argument);
  }

  TEST(QuantityCheck, relative_adjustment_parse)
  {
    auto increase = RelativeAdjustment::parse("+0.05mm");
    EXPECT_TRUE(increase.increase);
    EXPECT_EQ(increase.unit, Unit::Millimeter);
    EXPECT_EQ(increase.toString(), "+0.05mm");

    auto decrease = RelativeAdjustment::parse("=-5%");
    EXPECT_FALSE(decrease.increase);
    EXPECT_EQ(decrease.unit, Unit::Percent);
    EXPECT_EQ(decrease.toString(), "-5%");

    EXPECT_FALSE(RelativeAdjustment::parse("+2").unit.has_value());

    EXPECT_THROW(RelativeAdjustment::parse("5"), std::invalid_argument);
    EXPECT_THROW(RelativeAdjustment::parse("+"), std::invalid_argument);
    EXPECT_THROW(RelativeAdjustment::parse("+-5"), std::invalid_argument);
    EXPECT_THROW(RelativeAdjustment::parse("+x"), std::invalid_argument);
  }

  TEST(QuantityCheck, relative_adjustment_apply)
  {
    EXPECT_EQ(adjust("0.2", "+0.05"), "0.25");
    EXPECT_EQ(adjust("20%", "-5%"), "15%");
    EXPECT_EQ(adjust("20%", "+5"), "25%");
    EXPECT_EQ(adjust("0.4mm", "+0.1mm"), "0.5mm");
    EXPECT_EQ(adjust("210", "+5"), "215");
    EXPECT_EQ(adjust("0.5", "+0.5"), "1.0");
  }

  TEST(QuantityCheck, relative_adjustment_clamps_unitless_values)
  {
    EXPECT_EQ(adjust("2", "-5"), "0");
    EXPECT_EQ(adjust("0.2", "-0.5"), "0.0");
    EXPECT_EQ(adjust("5%", "-10%"), "-5%");
  }

  TEST(QuantityCheck, relative_adjustment_unit_mismatch)
  {
    EXPECT_THROW(adjust("20%", "+5mm"), std::invalid_argument);
    EXPECT_THROW(adjust("0.2", "+5%"), std::invalid_argument);
  }
} // namespace QuantityCheck
