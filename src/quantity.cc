#include "quantity.hh"
#include "tree/PropertyRule.hh"

#include <cctype>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
  // Integer digits allowed before the value no longer fits the mantissa
  constexpr size_t max_integer_digits = 12;

  bool endsWith(const std::string &text, const std::string &suffix)
  {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
  }

  // Splits a trailing "%" or "mm" from 'text'
  std::optional<ProfileBundle::Unit> takeUnit(std::string &text)
  {
    if(endsWith(text, "%")) {
      text.pop_back();
      return ProfileBundle::Unit::Percent;
    }

    if(endsWith(text, "mm")) {
      text.erase(text.size() - 2);
      return ProfileBundle::Unit::Millimeter;
    }

    return std::nullopt;
  }

  std::invalid_argument invalidValue(const std::string &kind, const std::string &text)
  {
    std::stringstream message;
    message << "Invalid " << kind << " format: " << text;
    return std::invalid_argument(message.str());
  }
} // namespace

ProfileBundle::Decimal::Decimal(int64_t units)
  : value_units{units}
{   }

ProfileBundle::Decimal ProfileBundle::Decimal::parse(const std::string &text)
{
  size_t pos = 0;
  bool negative = false;
  if(pos < text.size() && text[pos] == '-') {
    negative = true;
    pos++;
  }

  std::string integer_digits;
  std::string fraction_digits;
  bool seen_point = false;

  for(; pos < text.size(); pos++) {
    char c = text[pos];
    if(c == '.' && !seen_point) {
      seen_point = true;
    }
    else if(std::isdigit(static_cast<unsigned char>(c))) {
      (seen_point? fraction_digits : integer_digits) += c;
    }
    else {
      throw invalidValue("number", text);
    }
  }

  if(integer_digits.empty() && fraction_digits.empty()) {
    throw invalidValue("number", text);
  }

  if(integer_digits.size() > max_integer_digits || fraction_digits.size() > static_cast<size_t>(places)) {
    std::stringstream message;
    message << "Number out of range: " << text;
    throw std::invalid_argument(message.str());
  }

  fraction_digits.resize(places, '0');

  int64_t units = 0;
  for(char c : integer_digits + fraction_digits) {
    units = units * 10 + (c - '0');
  }

  return Decimal(negative? -units : units);
}

ProfileBundle::Decimal ProfileBundle::Decimal::fromUnits(int64_t units)
{
  return Decimal(units);
}

int64_t ProfileBundle::Decimal::units() const
{
  return value_units;
}

bool ProfileBundle::Decimal::isIntegral() const
{
  return value_units % scale == 0;
}

bool ProfileBundle::Decimal::isNegative() const
{
  return value_units < 0;
}

std::string ProfileBundle::Decimal::toString(bool force_fraction) const
{
  int64_t magnitude = value_units < 0? -value_units : value_units;

  std::stringstream ss;
  if(value_units < 0) {
    ss << '-';
  }

  ss << magnitude / scale;

  if(isIntegral() && !force_fraction) {
    return ss.str();
  }

  std::string fraction = std::to_string(magnitude % scale);
  fraction.insert(0, places - fraction.size(), '0');
  while(fraction.size() > 1 && fraction.back() == '0') {
    fraction.pop_back();
  }

  ss << '.' << fraction;
  return ss.str();
}

ProfileBundle::Decimal ProfileBundle::Decimal::operator+(const Decimal &other) const
{
  return Decimal(value_units + other.value_units);
}

ProfileBundle::Decimal ProfileBundle::Decimal::operator-(const Decimal &other) const
{
  return Decimal(value_units - other.value_units);
}

std::string ProfileBundle::unitSuffix(Unit unit)
{
  switch(unit) {
    case Unit::Percent:
      return "%";
    case Unit::Millimeter:
      return "mm";
    default:
      return "";
  }
}

ProfileBundle::Quantity ProfileBundle::Quantity::parse(const std::string &text)
{
  std::string number = Tree::PropertyRule::trim(text);
  auto unit = takeUnit(number);

  Quantity result;
  try {
    result.magnitude = Decimal::parse(number);
  }
  catch(const std::invalid_argument &) {
    throw invalidValue("value", text);
  }

  result.unit = unit.value_or(Unit::None);
  result.integral = number.find('.') == std::string::npos;
  return result;
}

std::string ProfileBundle::Quantity::toString() const
{
  bool force_fraction = !integral || !magnitude.isIntegral();
  return magnitude.toString(force_fraction) + unitSuffix(unit);
}

ProfileBundle::RelativeAdjustment ProfileBundle::RelativeAdjustment::parse(const std::string &text)
{
  std::string expression = Tree::PropertyRule::trim(text);
  if(!expression.empty() && expression.front() == '=') {
    expression = Tree::PropertyRule::trim(expression.substr(1));
  }

  if(expression.empty() || (expression.front() != '+' && expression.front() != '-')) {
    throw invalidValue("relative value", text);
  }

  RelativeAdjustment result;
  result.increase = expression.front() == '+';

  std::string number = Tree::PropertyRule::trim(expression.substr(1));
  result.unit = takeUnit(number);

  if(!number.empty() && number.front() == '-') {
    throw invalidValue("relative value", text);
  }

  try {
    result.amount = Decimal::parse(number);
  }
  catch(const std::invalid_argument &) {
    throw invalidValue("relative value", text);
  }

  return result;
}

ProfileBundle::Quantity ProfileBundle::RelativeAdjustment::apply(const Quantity &current) const
{
  if(unit.has_value() && *unit != current.unit) {
    std::stringstream message;
    message << "Unit mismatch: expected '" << unitSuffix(*unit) << "', got '" << unitSuffix(current.unit) << "'";
    throw std::invalid_argument(message.str());
  }

  Quantity result = current;
  result.magnitude = increase? current.magnitude + amount : current.magnitude - amount;

  if(current.unit == Unit::None && result.magnitude.isNegative()) {
    result.magnitude = Decimal();
  }

  return result;
}

std::string ProfileBundle::RelativeAdjustment::toString() const
{
  return std::string(increase? "+" : "-") + amount.toString(false) + unitSuffix(unit.value_or(Unit::None));
}
