#pragma once

#include "Block.h"
#include "Miner.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cl {

/**
 * Append-only, hash-linked, proof-of-work sealed chain of report blocks.
 *
 * The chain always holds at least the fixed genesis block. It grows only
 * through append() and is replaced only through loadAndValidate(), which
 * refuses any candidate that fails validation. Callers get copies, never
 * references into the internal sequence.
 *
 * All public methods lock an internal mutex, so one instance can be shared
 * between threads. Mining runs under that lock.
 */
class BlockChain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Validation error codes
  constexpr static int32_t E_CHAIN_EMPTY = 1;    // Candidate has no blocks
  constexpr static int32_t E_BLOCK_GENESIS = 2;  // First block is not the genesis block
  constexpr static int32_t E_BLOCK_INDEX = 3;    // Index does not match position
  constexpr static int32_t E_BLOCK_HASH = 4;     // Stored hash differs from recomputed hash
  constexpr static int32_t E_BLOCK_CHAIN = 5;    // previousHash does not match predecessor

  constexpr static uint32_t DEFAULT_DIFFICULTY = 2;
  constexpr static uint32_t MAX_DIFFICULTY = 8;

  // 2024-01-01T00:00:00Z
  constexpr static int64_t GENESIS_TIMESTAMP = 1704067200000;
  constexpr static const char *GENESIS_REPORT_ID = "GENESIS";
  constexpr static const char *GENESIS_PREVIOUS_HASH =
      "0000000000000000000000000000000000000000000000000000000000000000";

  struct Config {
    uint32_t difficulty{ DEFAULT_DIFFICULTY };
    // Sealing clock in ms since epoch; system clock when empty
    std::function<int64_t()> clock;
  };

  BlockChain();
  /**
   * @throws std::invalid_argument if config.difficulty > MAX_DIFFICULTY
   */
  explicit BlockChain(const Config &config);
  ~BlockChain() override = default;

  /**
   * The fixed first block. Not mined: nonce 0, hash computed normally.
   */
  static Block createGenesis();

  /**
   * SHA-256 hex digest of raw text, for hashing descriptions and evidence
   * before they are put into a payload
   */
  static std::string digest(const std::string &rawText);

  /**
   * Digest of the canonical payload encoding. Lets a holder of a payload
   * check it against a block without recomputing the proof of work.
   */
  static std::string payloadDigest(const BlockPayload &payload);

  /**
   * Mine and append one block carrying the payload.
   * A payload timestamp of 0 is replaced with the sealing instant.
   * @return Copy of the appended block
   */
  Block append(BlockPayload payload);

  bool isValid() const;

  /**
   * Same check as isValid() with the reason for a failure
   */
  Roe<void> validate() const;

  /**
   * Validate a block sequence without touching any chain: genesis identity,
   * index/position agreement, recomputed hashes and previousHash links.
   * Stops at the first failure.
   */
  static Roe<void> verify(const std::vector<Block> &blocks);

  /**
   * Replace the chain with the candidate if it is valid. On failure the
   * current chain is kept unchanged.
   * @return true if the candidate was adopted
   */
  bool loadAndValidate(std::vector<Block> candidate);

  Block latest() const;
  size_t length() const;
  std::optional<Block> findByReportId(const std::string &reportId) const;
  std::optional<Block> getBlock(uint64_t index) const;

  /**
   * Copy of the full chain, genesis first, for persistence
   */
  std::vector<Block> exportSnapshot() const;

  uint32_t getDifficulty() const { return miner_.getDifficulty(); }

private:
  int64_t now() const;

  mutable std::mutex mutex_;
  std::vector<Block> chain_;
  Miner miner_;
  std::function<int64_t()> clock_;
};

} // namespace cl
