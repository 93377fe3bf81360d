#include "FileSnapshotStore.h"
#include "../lib/Utilities.h"

#include <filesystem>

namespace cl {

FileSnapshotStore::FileSnapshotStore(const std::string &filePath)
    : SnapshotStore("civic.ledger.snapshot"), filePath_(filePath) {}

nlohmann::json FileSnapshotStore::toJson(const std::vector<Block> &blocks) {
  nlohmann::json document;
  document["version"] = FORMAT_VERSION;
  nlohmann::json array = nlohmann::json::array();
  for (const auto &block : blocks) {
    array.push_back(block.toJson());
  }
  document["blocks"] = array;
  return document;
}

FileSnapshotStore::Roe<std::vector<Block>>
FileSnapshotStore::fromJson(const nlohmann::json &document) {
  if (!document.is_object() || !document.contains("version") ||
      !document["version"].is_number_unsigned()) {
    return Error(E_FORMAT, "Snapshot has no version");
  }
  uint32_t version = document["version"].get<uint32_t>();
  if (version != FORMAT_VERSION) {
    return Error(E_FORMAT, "Unsupported snapshot version " + std::to_string(version));
  }
  if (!document.contains("blocks") || !document["blocks"].is_array()) {
    return Error(E_FORMAT, "Snapshot has no block array");
  }

  std::vector<Block> blocks;
  blocks.reserve(document["blocks"].size());
  for (const auto &item : document["blocks"]) {
    auto block = Block::fromJson(item);
    if (!block) {
      return Error(E_FORMAT, "Invalid block in snapshot: " + block.error().message);
    }
    blocks.push_back(block.value());
  }
  return blocks;
}

FileSnapshotStore::Roe<void> FileSnapshotStore::save(const std::vector<Block> &blocks) {
  auto result = utl::writeFileAtomic(filePath_, toJson(blocks).dump(2));
  if (!result) {
    log().error << "Failed to save snapshot: " << result.error().message;
    return Error(E_IO, result.error().message);
  }
  log().debug << "Saved snapshot of " << blocks.size() << " blocks to " << filePath_;
  return {};
}

FileSnapshotStore::Roe<std::vector<Block>> FileSnapshotStore::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(filePath_, ec)) {
    return Error(E_NOT_FOUND, "No snapshot at " + filePath_);
  }

  auto document = utl::loadJsonFile(filePath_);
  if (!document) {
    return Error(E_FORMAT, document.error().message);
  }

  auto blocks = fromJson(document.value());
  if (!blocks) {
    log().error << "Failed to decode snapshot " << filePath_ << ": "
                << blocks.error().message;
    return blocks;
  }
  log().info << "Read snapshot of " << blocks.value().size() << " blocks from "
             << filePath_;
  return blocks;
}

} // namespace cl
