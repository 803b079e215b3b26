#ifndef ICPT_LEDGER_AMOUNT_H
#define ICPT_LEDGER_AMOUNT_H

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace icpt {

/**
 * Unsigned 128-bit token amount.
 *
 * All arithmetic is checked: the checked* functions return false instead of
 * wrapping and leave the output untouched on failure.
 */
class Amount {
public:
  // Fixed 128 bits; the backend throws rather than wraps if misused
  using Value = boost::multiprecision::number<
      boost::multiprecision::cpp_int_backend<
          128, 128, boost::multiprecision::unsigned_magnitude,
          boost::multiprecision::checked, void>>;

  Amount() = default;
  Amount(uint64_t value) : value_(value) {}
  explicit Amount(const Value &value) : value_(value) {}

  static Amount fromParts(uint64_t high, uint64_t low);
  static Amount max();

  const Value &value() const { return value_; }
  uint64_t high() const;
  uint64_t low() const;
  bool isZero() const { return value_.is_zero(); }

  bool checkedAdd(const Amount &other, Amount &out) const;
  bool checkedSub(const Amount &other, Amount &out) const;
  bool checkedMul(uint64_t factor, Amount &out) const;

  /**
   * Convert whole tokens to base units: wholeTokens * 10^decimals.
   * @return false on overflow
   */
  static bool toTokenUnits(uint64_t wholeTokens, uint8_t decimals,
                           Amount &out);

  // Decimal representation
  std::string toString() const { return value_.str(); }

  /**
   * Parse a decimal string (digits only, no sign).
   * @return false for empty input, stray characters or values above max()
   */
  static bool fromString(const std::string &str, Amount &out);

  /**
   * Read an amount from JSON: a decimal string or an unsigned number.
   */
  static bool fromJson(const nlohmann::json &j, Amount &out);

  friend bool operator==(const Amount &a, const Amount &b) {
    return a.value_ == b.value_;
  }
  friend bool operator!=(const Amount &a, const Amount &b) { return !(a == b); }
  friend bool operator<(const Amount &a, const Amount &b) {
    return a.value_ < b.value_;
  }
  friend bool operator>(const Amount &a, const Amount &b) { return b < a; }
  friend bool operator<=(const Amount &a, const Amount &b) { return !(b < a); }
  friend bool operator>=(const Amount &a, const Amount &b) { return !(a < b); }

private:
  Value value_{ 0 };
};

std::ostream &operator<<(std::ostream &os, const Amount &amount);

// Amounts go to JSON as decimal strings, they do not fit a JSON number
void to_json(nlohmann::json &j, const Amount &amount);

} // namespace icpt

#endif // ICPT_LEDGER_AMOUNT_H
