#ifndef CIVIC_LEDGER_SNAPSHOT_STORE_HPP
#define CIVIC_LEDGER_SNAPSHOT_STORE_HPP

#include "Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <string>
#include <vector>

namespace cl {

/**
 * Durable home of the serialized chain. The chain engine never talks to a
 * store; the hosting service saves after each append and loads once at
 * startup, feeding the result to BlockChain::loadAndValidate().
 */
class SnapshotStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1; // Nothing saved yet
  constexpr static int32_t E_IO = 2;        // Read or write failed
  constexpr static int32_t E_FORMAT = 3;    // Stored data cannot be decoded

  explicit SnapshotStore(const std::string &name) : Module(name) {}
  ~SnapshotStore() override = default;

  /**
   * Replace the stored snapshot with the given chain
   */
  virtual Roe<void> save(const std::vector<Block> &blocks) = 0;

  /**
   * Read the stored snapshot. Decoding is structural only; integrity is
   * the chain's job.
   */
  virtual Roe<std::vector<Block>> load() const = 0;
};

} // namespace cl

#endif // CIVIC_LEDGER_SNAPSHOT_STORE_HPP
