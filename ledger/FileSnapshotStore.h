#pragma once

#include "SnapshotStore.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace cl {

/**
 * Snapshot kept as one JSON document:
 *
 *   { "version": 1, "blocks": [ <Block::toJson()>, ... ] }
 *
 * save() writes a temporary file and renames it over the old snapshot.
 */
class FileSnapshotStore : public SnapshotStore {
public:
  constexpr static uint32_t FORMAT_VERSION = 1;

  explicit FileSnapshotStore(const std::string &filePath);

  const std::string &getFilePath() const { return filePath_; }

  Roe<void> save(const std::vector<Block> &blocks) override;
  Roe<std::vector<Block>> load() const override;

  static nlohmann::json toJson(const std::vector<Block> &blocks);
  static Roe<std::vector<Block>> fromJson(const nlohmann::json &document);

private:
  std::string filePath_;
};

} // namespace cl
