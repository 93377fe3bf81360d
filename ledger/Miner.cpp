#include "Miner.h"
#include "Canonical.h"

namespace cl {

Miner::Miner(uint32_t difficulty)
    : difficulty_(difficulty), target_(difficulty, '0') {}

Miner::Result Miner::mine(uint64_t index, int64_t timestamp,
                          const BlockPayload &payload,
                          const std::string &previousHash) const {
  // The nonce is the last encoded field, so the rest is encoded once
  const std::string prefix =
      canonical::encodeBlockPrefix(index, timestamp, payload, previousHash);

  Result result;
  for (uint64_t nonce = 0;; ++nonce) {
    std::string hash = Block::hashEncoded(prefix + canonical::encodeNonce(nonce));
    if (meetsDifficulty(hash)) {
      result.hash = std::move(hash);
      result.nonce = nonce;
      return result;
    }
  }
}

bool Miner::meetsDifficulty(const std::string &hash) const {
  return hash.size() >= target_.size() &&
         hash.compare(0, target_.size(), target_) == 0;
}

bool Miner::meetsDifficulty(const std::string &hash, uint32_t difficulty) {
  return Miner(difficulty).meetsDifficulty(hash);
}

} // namespace cl
