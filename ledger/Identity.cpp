#include "Identity.h"
#include "../lib/Utilities.h"

namespace icpt {

Identity::Roe<Identity> Identity::fromText(const std::string &text) {
  if (text.empty()) {
    return Error(E_EMPTY, "Identity must not be empty");
  }
  std::string bytes = utl::fromJsonSafeString(text);
  if (bytes.empty()) {
    return Error(E_HEX, "Invalid hex identity: " + text);
  }
  return Identity(bytes);
}

std::string Identity::toText() const { return utl::toJsonSafeString(bytes_); }

std::ostream &operator<<(std::ostream &os, const Identity &identity) {
  return os << identity.toText();
}

} // namespace icpt
