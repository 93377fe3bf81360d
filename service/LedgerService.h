#pragma once

#include "ReportIntake.h"
#include "ReportRegistry.h"
#include "../ledger/BlockChain.h"
#include "../ledger/SnapshotStore.hpp"
#include "../lib/Logger.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cl {

/**
 * Hosts the report ledger in a work directory:
 *
 *   <workDir>/config.json   optional settings
 *   <workDir>/chain.json    chain snapshot, rewritten after every append
 *   <workDir>/reports.json  report registry
 *
 * On init the snapshot is restored through BlockChain::loadAndValidate().
 * A snapshot that fails validation is refused, audited as
 * BLOCKCHAIN_INTEGRITY_FAILED, and the service starts from the genesis block.
 */
class LedgerService : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_STATE = 2;
  constexpr static int32_t E_INVALID_INPUT = 3;
  constexpr static int32_t E_NOT_FOUND = 4;
  constexpr static int32_t E_PERSIST = 5;
  constexpr static int32_t E_TRANSITION = 6;

  // Draws of a fresh reference id before a submission is refused
  constexpr static uint32_t MAX_REFERENCE_ATTEMPTS = 32;

  constexpr static const char *FILE_CONFIG = "config.json";
  constexpr static const char *LOGGER_ROOT = "civic";

  struct Config {
    uint32_t difficulty{ BlockChain::DEFAULT_DIFFICULTY };
    std::string snapshotFile{ "chain.json" };
    std::string registryFile{ "reports.json" };
    std::string logFile; // none when empty
    logging::Level logLevel{ logging::Level::INFO };
    // Not read from config.json; empty uses ReportIntake::makeReferenceId
    std::function<std::string()> referenceSource;

    /**
     * Read settings from a parsed config.json. Missing keys keep defaults.
     */
    static Roe<Config> fromJson(const nlohmann::json &j);
  };

  struct SubmitReceipt {
    std::string reportId;
    std::string referenceId;
    uint64_t blockIndex{ 0 };
    std::string blockHash;
    ReportStatus status{ ReportStatus::PENDING };
    size_t chainLength{ 0 };
    std::string submittedAt; // ISO-8601 UTC

    nlohmann::json toJson() const;
  };

  struct VerifyResult {
    std::string reportId;
    bool chainIntact{ false };
    uint64_t index{ 0 };
    std::string hash;
    std::string previousHash;
    std::string timestamp; // ISO-8601 UTC
    uint64_t nonce{ 0 };
    std::string dataHash;

    nlohmann::json toJson() const;
  };

  struct HealthReport {
    bool healthy{ false };
    size_t chainLength{ 0 };
    uint64_t latestBlockIndex{ 0 };
    std::string latestBlockHash;
    std::string lastUpdated; // ISO-8601 UTC

    nlohmann::json toJson() const;
  };

  LedgerService();
  ~LedgerService() override;

  /**
   * Settings from <workDir>/config.json, or defaults when there is none
   */
  static Roe<Config> loadConfig(const std::string &workDir);

  /**
   * init(workDir, loadConfig(workDir))
   */
  Roe<void> init(const std::string &workDir);
  Roe<void> init(const std::string &workDir, const Config &config);

  bool isInitialized() const;

  Roe<SubmitReceipt> submit(const ReportSubmission &submission);
  Roe<VerifyResult> verify(const std::string &reportId) const;
  /**
   * Full chain validation. A failed check is audited as
   * BLOCKCHAIN_INTEGRITY_FAILED.
   */
  Roe<HealthReport> health();

  Roe<ReportRecord> getReport(const std::string &reportId) const;
  Roe<std::vector<ReportRecord>> listReports(const ReportFilter &filter) const;
  Roe<ReportRecord> updateStatus(const std::string &reportId, ReportStatus status,
                                 const std::string &actor = "ADMIN");

  /**
   * The full chain in snapshot format
   */
  Roe<nlohmann::json> exportChain() const;

  const Config &getConfig() const { return config_; }

private:
  Roe<void> configureLogging(const std::string &workDir);
  void releaseLogging();
  void restoreChain();
  void recordSystemEvent(const std::string &event, const std::string &details);
  Roe<void> checkInitialized() const;

  mutable std::mutex mutex_;
  Config config_;
  std::string registryPath_;
  std::unique_ptr<BlockChain> chain_;
  std::unique_ptr<SnapshotStore> store_;
  std::shared_ptr<logging::Handler> spLogFile_;
  ReportIntake intake_;
  ReportRegistry registry_;
};

} // namespace cl
