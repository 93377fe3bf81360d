#pragma once

#include "Digest.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cl {

/**
 * Report urgency. NONE is reserved for the genesis block.
 */
enum class Urgency { NONE, CRITICAL, HIGH, MEDIUM, LOW };

/**
 * Report status as recorded at sealing time. Later changes are tracked
 * outside the chain.
 */
enum class ReportStatus { PENDING, UNDER_REVIEW, RESOLVED, DISMISSED };

enum class Identity { NAMED, ANONYMOUS };

std::string toString(Urgency urgency);
std::string toString(ReportStatus status);
std::string toString(Identity identity);

bool urgencyFromString(const std::string &str, Urgency &urgency);
bool statusFromString(const std::string &str, ReportStatus &status);
bool identityFromString(const std::string &str, Identity &identity);

/**
 * Who filed a report. An anonymous reporter has no citizen id and a named
 * one always has one; no other combination can be built.
 */
class Reporter {
public:
  // Anonymous
  Reporter() = default;

  static Reporter anonymous() { return Reporter(); }
  static Reporter named(const std::string &citizenId) {
    return Reporter(Identity::NAMED, citizenId);
  }

  Identity getIdentity() const { return identity_; }
  bool isAnonymous() const { return identity_ == Identity::ANONYMOUS; }
  const std::optional<std::string> &getCitizenId() const { return citizenId_; }

  bool operator==(const Reporter &other) const {
    return identity_ == other.identity_ && citizenId_ == other.citizenId_;
  }
  bool operator!=(const Reporter &other) const { return !(*this == other); }

private:
  Reporter(Identity identity, std::string citizenId)
      : identity_(identity), citizenId_(std::move(citizenId)) {}

  Identity identity_{ Identity::ANONYMOUS };
  std::optional<std::string> citizenId_;
};

struct Location {
  std::string area;
  std::string address;
  std::string nearestStation;

  bool operator==(const Location &other) const {
    return area == other.area && address == other.address &&
           nearestStation == other.nearestStation;
  }
  bool operator!=(const Location &other) const { return !(*this == other); }
};

/**
 * One civic report at the moment of sealing.
 * Free text and evidence only appear as digests.
 */
struct BlockPayload {
  std::string reportId;
  std::string category;
  Urgency urgency{ Urgency::NONE };
  Location location;
  Digest descriptionHash;
  std::vector<Digest> evidenceHashes;
  Reporter reporter;
  int64_t timestamp{ 0 }; // ms since epoch
  std::vector<std::string> authorityRouted;
  ReportStatus status{ ReportStatus::PENDING };

  bool operator==(const BlockPayload &other) const;
  bool operator!=(const BlockPayload &other) const { return !(*this == other); }

  nlohmann::json toJson() const;
  static cl::Roe<BlockPayload> fromJson(const nlohmann::json &j);
};

/**
 * Sealed chain element. hash covers every other field.
 */
struct Block {
  uint64_t index{ 0 };
  int64_t timestamp{ 0 }; // ms since epoch
  BlockPayload data;
  std::string previousHash;
  std::string hash;
  uint64_t nonce{ 0 };

  /**
   * Recompute the hash from the current field values
   */
  std::string calculateHash() const;

  /**
   * SHA-256 (OpenSSL EVP) over the canonical encoding of the block fields
   */
  static std::string computeHash(uint64_t index, int64_t timestamp,
                                 const BlockPayload &data,
                                 const std::string &previousHash, uint64_t nonce);

  /**
   * Hash an already encoded block; used by the miner, which encodes the
   * nonce-independent prefix once per search.
   */
  static std::string hashEncoded(const std::string &encoded);

  bool operator==(const Block &other) const;
  bool operator!=(const Block &other) const { return !(*this == other); }

  nlohmann::json toJson() const;
  static cl::Roe<Block> fromJson(const nlohmann::json &j);
};

} // namespace cl
