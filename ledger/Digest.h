#pragma once

#include "../lib/Utilities.h"

#include <string>

namespace cl {

/**
 * A SHA-256 digest in its 64-character lowercase hex form.
 *
 * There is no constructor from an arbitrary string: a Digest is either the
 * hash of some raw text (of) or a string that already is a digest
 * (fromHex). Raw report text therefore cannot end up in a Digest field.
 */
class Digest {
public:
  // All-zero digest
  Digest();

  static Digest of(const std::string &rawText);
  static cl::Roe<Digest> fromHex(const std::string &hex);
  static Digest zero() { return Digest(); }

  const std::string &hex() const { return hex_; }
  bool isZero() const;

  bool operator==(const Digest &other) const { return hex_ == other.hex_; }
  bool operator!=(const Digest &other) const { return hex_ != other.hex_; }

private:
  explicit Digest(std::string hex) : hex_(std::move(hex)) {}

  std::string hex_;
};

} // namespace cl
