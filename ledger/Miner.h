#pragma once

#include "Block.h"

#include <cstdint>
#include <string>

namespace cl {

/**
 * Proof-of-work search: finds the first nonce (counting from 0) whose block
 * hash starts with `difficulty` '0' characters. Expected work is about
 * 16^difficulty hashes.
 */
class Miner {
public:
  struct Result {
    std::string hash;
    uint64_t nonce{ 0 };
  };

  explicit Miner(uint32_t difficulty);

  uint32_t getDifficulty() const { return difficulty_; }

  Result mine(uint64_t index, int64_t timestamp, const BlockPayload &payload,
              const std::string &previousHash) const;

  bool meetsDifficulty(const std::string &hash) const;
  static bool meetsDifficulty(const std::string &hash, uint32_t difficulty);

private:
  uint32_t difficulty_;
  std::string target_;
};

} // namespace cl
