#ifndef PROFILEBUNDLE_QUANTITY_HH
#define PROFILEBUNDLE_QUANTITY_HH

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace ProfileBundle {
  // Exact fixed-point decimal with up to six fractional digits
  class Decimal {
    public:
      static constexpr int places = 6;
      static constexpr int64_t scale = 1000000;

      Decimal() = default;

      // Accepts an optional '-' sign, digits and at most one '.'
      // Throws std::invalid_argument for anything else
      static Decimal parse(const std::string &text);

      static Decimal fromUnits(int64_t units);

      // Value multiplied by 'scale'
      int64_t units() const;

      bool isIntegral() const;
      bool isNegative() const;

      // Plain digits. Without 'force_fraction', integral values have no fractional part;
      // otherwise trailing zeros are trimmed down to one fractional digit ("1.0", "0.25").
      std::string toString(bool force_fraction) const;

      Decimal operator+(const Decimal &other) const;
      Decimal operator-(const Decimal &other) const;

      auto operator<=>(const Decimal &other) const = default;

    private:
      explicit Decimal(int64_t units);

      int64_t value_units = 0;
  };

  enum class Unit { None, Percent, Millimeter };

  // "" / "%" / "mm"
  std::string unitSuffix(Unit unit);

  // A property value made of a number and an optional unit ("0.2", "15%", "0.4mm")
  struct Quantity {
    Decimal magnitude;
    Unit unit = Unit::None;

    // True when the source value was written without a '.'
    bool integral = true;

    // Throws std::invalid_argument for values that are not a number with an optional unit
    static Quantity parse(const std::string &text);

    std::string toString() const;

    bool operator==(const Quantity &other) const = default;
  };

  // A "+N[unit]" or "-N[unit]" change of an existing value; a leading '=' is accepted
  struct RelativeAdjustment {
    bool increase = true;
    Decimal amount;

    // Unset when the expression carries no unit
    std::optional<Unit> unit;

    // Throws std::invalid_argument for malformed expressions
    static RelativeAdjustment parse(const std::string &text);

    /**
    * @brief Applies the change to 'current'
    *
    * @details
    * The unit of the adjustment must equal the unit of 'current' when it is given.
    * Results of unitless values are clamped at zero. The result is formatted like 'current'.
    *
    * @throws std::invalid_argument on a unit mismatch
    */
    Quantity apply(const Quantity &current) const;

    std::string toString() const;
  };
} // namespace ProfileBundle

#endif // PROFILEBUNDLE_QUANTITY_HH
