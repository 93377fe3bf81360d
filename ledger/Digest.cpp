#include "Digest.h"

namespace cl {

Digest::Digest() : hex_(64, '0') {}

Digest Digest::of(const std::string &rawText) {
  return Digest(utl::sha256(rawText));
}

cl::Roe<Digest> Digest::fromHex(const std::string &hex) {
  if (!utl::isSha256Hex(hex)) {
    // The rejected value is not echoed: it may be raw report text
    return Error(1, "Not a SHA-256 hex digest (length " + std::to_string(hex.size()) + ")");
  }
  return Digest(hex);
}

bool Digest::isZero() const {
  return hex_.find_first_not_of('0') == std::string::npos;
}

} // namespace cl
