#include "BlockChain.h"
#include "Canonical.h"
#include "../lib/Utilities.h"

#include <stdexcept>

namespace cl {

static uint32_t checkedDifficulty(uint32_t difficulty) {
  if (difficulty > BlockChain::MAX_DIFFICULTY) {
    throw std::invalid_argument("Mining difficulty " + std::to_string(difficulty) +
                                " exceeds maximum " +
                                std::to_string(BlockChain::MAX_DIFFICULTY));
  }
  return difficulty;
}

BlockChain::BlockChain() : BlockChain(Config()) {}

BlockChain::BlockChain(const Config &config)
    : Module("civic.ledger.chain"), miner_(checkedDifficulty(config.difficulty)),
      clock_(config.clock) {
  chain_.push_back(createGenesis());
}

Block BlockChain::createGenesis() {
  BlockPayload data;
  data.reportId = GENESIS_REPORT_ID;
  data.category = "SYSTEM";
  data.urgency = Urgency::NONE;
  data.location.area = "India";
  data.location.address = "Origin";
  data.location.nearestStation = "N/A";
  data.descriptionHash = Digest::zero();
  data.reporter = Reporter::anonymous();
  data.timestamp = GENESIS_TIMESTAMP;
  data.status = ReportStatus::RESOLVED;

  Block genesis;
  genesis.index = 0;
  genesis.timestamp = GENESIS_TIMESTAMP;
  genesis.data = data;
  genesis.previousHash = GENESIS_PREVIOUS_HASH;
  genesis.nonce = 0;
  genesis.hash = genesis.calculateHash();
  return genesis;
}

std::string BlockChain::digest(const std::string &rawText) {
  return utl::sha256(rawText);
}

std::string BlockChain::payloadDigest(const BlockPayload &payload) {
  return utl::sha256(canonical::encodePayload(payload));
}

int64_t BlockChain::now() const {
  return clock_ ? clock_() : utl::getCurrentTimeMs();
}

Block BlockChain::append(BlockPayload payload) {
  std::lock_guard<std::mutex> lock(mutex_);

  const Block &previous = chain_.back();

  Block block;
  block.index = previous.index + 1;
  block.timestamp = now();
  block.previousHash = previous.hash;
  if (payload.timestamp == 0) {
    payload.timestamp = block.timestamp;
  }
  block.data = std::move(payload);

  auto mined = miner_.mine(block.index, block.timestamp, block.data, block.previousHash);
  block.hash = mined.hash;
  block.nonce = mined.nonce;

  chain_.push_back(block);

  log().debug << "Sealed block " << block.index << " for report "
              << block.data.reportId << " nonce=" << block.nonce;
  return block;
}

BlockChain::Roe<void> BlockChain::verify(const std::vector<Block> &blocks) {
  if (blocks.empty()) {
    return Error(E_CHAIN_EMPTY, "Chain is empty");
  }

  if (blocks.front() != createGenesis()) {
    return Error(E_BLOCK_GENESIS, "Block 0 is not the genesis block");
  }

  for (size_t i = 1; i < blocks.size(); i++) {
    const Block &current = blocks[i];
    const Block &previous = blocks[i - 1];

    if (current.index != i) {
      return Error(E_BLOCK_INDEX, "Block at position " + std::to_string(i) +
                                      " has index " + std::to_string(current.index));
    }

    // Recompute rather than trust the stored hash
    if (current.hash != current.calculateHash()) {
      return Error(E_BLOCK_HASH, "Block " + std::to_string(i) + " hash mismatch");
    }

    if (current.previousHash != previous.hash) {
      return Error(E_BLOCK_CHAIN, "Block " + std::to_string(i) + " chain link broken");
    }
  }

  return {};
}

BlockChain::Roe<void> BlockChain::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto result = verify(chain_);
  if (!result) {
    log().error << "Integrity check failed: " << result.error().message;
  }
  return result;
}

bool BlockChain::isValid() const { return validate().isOk(); }

bool BlockChain::loadAndValidate(std::vector<Block> candidate) {
  auto result = verify(candidate);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!result) {
    log().critical << "Refusing to load chain of " << candidate.size()
                   << " blocks: " << result.error().message
                   << ". Keeping current chain of " << chain_.size() << " blocks";
    return false;
  }

  chain_ = std::move(candidate);
  log().info << "Loaded chain of " << chain_.size() << " blocks";
  return true;
}

Block BlockChain::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.back();
}

size_t BlockChain::length() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_.size();
}

std::optional<Block> BlockChain::findByReportId(const std::string &reportId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &block : chain_) {
    if (block.data.reportId == reportId) {
      return block;
    }
  }
  return std::nullopt;
}

std::optional<Block> BlockChain::getBlock(uint64_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= chain_.size()) {
    return std::nullopt;
  }
  return chain_[index];
}

std::vector<Block> BlockChain::exportSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_;
}

} // namespace cl
