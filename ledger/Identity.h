#ifndef ICPT_LEDGER_IDENTITY_H
#define ICPT_LEDGER_IDENTITY_H

#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace icpt {

/**
 * Opaque caller identity (principal).
 * The ledger only compares identities; the bytes are never interpreted.
 */
class Identity {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_EMPTY = 1;
  constexpr static int32_t E_HEX = 2;

  Identity() = default;
  explicit Identity(const std::string &bytes) : bytes_(bytes) {}

  /**
   * Parse the text form produced by toText().
   * Printable text is taken verbatim, "0x"-prefixed text is hex decoded.
   */
  static Roe<Identity> fromText(const std::string &text);

  const std::string &bytes() const { return bytes_; }
  bool isEmpty() const { return bytes_.empty(); }

  // Printable form, binary identities come out as "0x" + hex
  std::string toText() const;

  bool operator==(const Identity &other) const { return bytes_ == other.bytes_; }
  bool operator!=(const Identity &other) const { return bytes_ != other.bytes_; }
  bool operator<(const Identity &other) const { return bytes_ < other.bytes_; }

private:
  std::string bytes_;
};

std::ostream &operator<<(std::ostream &os, const Identity &identity);

} // namespace icpt

#endif // ICPT_LEDGER_IDENTITY_H
