#include "Amount.h"

#include <limits>

namespace icpt {

Amount Amount::fromParts(uint64_t high, uint64_t low) {
  Value value(high);
  value <<= 64;
  value |= low;
  return Amount(value);
}

Amount Amount::max() { return Amount(std::numeric_limits<Value>::max()); }

uint64_t Amount::high() const {
  return static_cast<uint64_t>(value_ >> 64);
}

uint64_t Amount::low() const {
  return static_cast<uint64_t>(value_ & Value(UINT64_MAX));
}

bool Amount::checkedAdd(const Amount &other, Amount &out) const {
  if (value_ > max().value_ - other.value_) {
    return false;
  }
  Value sum = value_ + other.value_;
  out.value_ = sum;
  return true;
}

bool Amount::checkedSub(const Amount &other, Amount &out) const {
  if (value_ < other.value_) {
    return false;
  }
  Value difference = value_ - other.value_;
  out.value_ = difference;
  return true;
}

bool Amount::checkedMul(uint64_t factor, Amount &out) const {
  if (factor != 0 && value_ > max().value_ / factor) {
    return false;
  }
  Value product = value_ * factor;
  out.value_ = product;
  return true;
}

bool Amount::toTokenUnits(uint64_t wholeTokens, uint8_t decimals,
                          Amount &out) {
  Amount result(wholeTokens);
  for (uint8_t i = 0; i < decimals; ++i) {
    if (!result.checkedMul(10, result)) {
      return false;
    }
  }
  out = result;
  return true;
}

bool Amount::fromString(const std::string &str, Amount &out) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (c < '0' || c > '9') {
      return false;
    }
  }

  // Parse unbounded first so that values above max() are reported, not thrown
  boost::multiprecision::cpp_int wide(str);
  if (wide > boost::multiprecision::cpp_int(max().value_)) {
    return false;
  }
  out.value_ = static_cast<Value>(wide);
  return true;
}

bool Amount::fromJson(const nlohmann::json &j, Amount &out) {
  if (j.is_string()) {
    return fromString(j.get<std::string>(), out);
  }
  if (j.is_number_unsigned()) {
    out = Amount(j.get<uint64_t>());
    return true;
  }
  if (j.is_number_integer() && j.get<int64_t>() >= 0) {
    out = Amount(static_cast<uint64_t>(j.get<int64_t>()));
    return true;
  }
  return false;
}

std::ostream &operator<<(std::ostream &os, const Amount &amount) {
  return os << amount.toString();
}

void to_json(nlohmann::json &j, const Amount &amount) {
  j = amount.toString();
}

} // namespace icpt
