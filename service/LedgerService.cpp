#include "LedgerService.h"
#include "../ledger/FileSnapshotStore.h"
#include "../lib/Utilities.h"

#include <filesystem>
#include <stdexcept>

namespace cl {

// ----------------- Config -----------------------------------------

LedgerService::Roe<LedgerService::Config>
LedgerService::Config::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  Config config;

  if (j.contains("difficulty")) {
    if (!j["difficulty"].is_number_unsigned()) {
      return Error(E_CONFIG, "Configuration 'difficulty' must be a non-negative integer");
    }
    uint64_t difficulty = j["difficulty"].get<uint64_t>();
    if (difficulty > BlockChain::MAX_DIFFICULTY) {
      return Error(E_CONFIG, "Configuration 'difficulty' must be at most " +
                                 std::to_string(BlockChain::MAX_DIFFICULTY));
    }
    config.difficulty = static_cast<uint32_t>(difficulty);
  }

  for (auto field : {std::make_pair("snapshotFile", &config.snapshotFile),
                     std::make_pair("registryFile", &config.registryFile),
                     std::make_pair("logFile", &config.logFile)}) {
    if (!j.contains(field.first)) {
      continue;
    }
    if (!j[field.first].is_string()) {
      return Error(E_CONFIG, "Configuration '" + std::string(field.first) +
                                 "' must be a string");
    }
    *field.second = j[field.first].get<std::string>();
  }
  if (config.snapshotFile.empty() || config.registryFile.empty()) {
    return Error(E_CONFIG, "Configuration file names must not be empty");
  }

  if (j.contains("logLevel")) {
    if (!j["logLevel"].is_string() ||
        !logging::levelFromString(j["logLevel"].get<std::string>(), config.logLevel)) {
      return Error(E_CONFIG, "Configuration 'logLevel' must be one of DEBUG, INFO, "
                             "WARNING, ERROR, CRITICAL");
    }
  }

  return config;
}

// ----------------- results ----------------------------------------

nlohmann::json LedgerService::SubmitReceipt::toJson() const {
  nlohmann::json j;
  j["reportId"] = reportId;
  j["referenceId"] = referenceId;
  j["blockIndex"] = blockIndex;
  j["blockHash"] = blockHash;
  j["status"] = toString(status);
  j["chainLength"] = chainLength;
  j["submittedAt"] = submittedAt;
  return j;
}

nlohmann::json LedgerService::VerifyResult::toJson() const {
  nlohmann::json j;
  j["reportId"] = reportId;
  j["verified"] = true;
  j["chainIntegrity"] = chainIntact ? "VALID" : "COMPROMISED";
  j["blockDetails"] = {{"index", index},
                       {"hash", hash},
                       {"previousHash", previousHash},
                       {"timestamp", timestamp},
                       {"nonce", nonce},
                       {"dataHash", dataHash}};
  return j;
}

nlohmann::json LedgerService::HealthReport::toJson() const {
  nlohmann::json j;
  j["status"] = healthy ? "HEALTHY" : "COMPROMISED";
  j["chainLength"] = chainLength;
  j["latestBlockIndex"] = latestBlockIndex;
  j["latestBlockHash"] = latestBlockHash;
  j["lastUpdated"] = lastUpdated;
  return j;
}

// ----------------- LedgerService ----------------------------------

LedgerService::LedgerService() : Module("civic.service") {}

LedgerService::~LedgerService() { releaseLogging(); }

LedgerService::Roe<LedgerService::Config>
LedgerService::loadConfig(const std::string &workDir) {
  auto configPath = std::filesystem::path(workDir) / FILE_CONFIG;
  std::error_code ec;
  if (!std::filesystem::exists(configPath, ec)) {
    return Config();
  }

  auto jsonResult = utl::loadJsonFile(configPath.string());
  if (!jsonResult) {
    return Error(E_CONFIG, jsonResult.error().message);
  }
  return Config::fromJson(jsonResult.value());
}

LedgerService::Roe<void> LedgerService::init(const std::string &workDir) {
  auto config = loadConfig(workDir);
  if (!config) {
    return config.error();
  }
  return init(workDir, config.value());
}

LedgerService::Roe<void> LedgerService::init(const std::string &workDir,
                                             const Config &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (chain_) {
    return Error(E_STATE, "Service is already initialized");
  }

  std::error_code ec;
  std::filesystem::create_directories(workDir, ec);
  if (ec) {
    return Error(E_CONFIG, "Failed to create work directory " + workDir + ": " +
                               ec.message());
  }

  config_ = config;
  auto logReady = configureLogging(workDir);
  if (!logReady) {
    return logReady;
  }

  log().info << "Starting ledger service in " << workDir;
  log().info << "  Difficulty: " << config_.difficulty;
  log().debug << "  Snapshot: " << config_.snapshotFile << ", registry: " << config_.registryFile;

  intake_.setReferenceSource(config_.referenceSource);
  registryPath_ = (std::filesystem::path(workDir) / config_.registryFile).string();
  auto registry = registry_.load(registryPath_);
  if (!registry) {
    releaseLogging();
    return Error(E_PERSIST, "Failed to load report registry: " + registry.error().message);
  }

  BlockChain::Config chainConfig;
  chainConfig.difficulty = config_.difficulty;
  chain_ = std::make_unique<BlockChain>(chainConfig);
  store_ = std::make_unique<FileSnapshotStore>(
      (std::filesystem::path(workDir) / config_.snapshotFile).string());

  restoreChain();

  if (chain_->isValid()) {
    log().info << "Chain intact with " << chain_->length() << " blocks";
  }
  return {};
}

LedgerService::Roe<void> LedgerService::configureLogging(const std::string &workDir) {
  auto logger = logging::getLogger(LOGGER_ROOT);
  logger.setLevel(config_.logLevel);
  if (config_.logFile.empty()) {
    return {};
  }

  auto logPath = std::filesystem::path(workDir) / config_.logFile;
  try {
    spLogFile_ = std::make_shared<logging::FileHandler>(logPath.string());
  } catch (const std::runtime_error &e) {
    return Error(E_CONFIG, e.what());
  }
  spLogFile_->setLevel(logging::Level::DEBUG);
  logger.addHandler(spLogFile_);
  return {};
}

void LedgerService::releaseLogging() {
  if (spLogFile_) {
    logging::getLogger(LOGGER_ROOT).removeHandler(spLogFile_);
    spLogFile_.reset();
  }
}

void LedgerService::restoreChain() {
  auto snapshot = store_->load();
  if (!snapshot) {
    if (snapshot.error().code == SnapshotStore::E_NOT_FOUND) {
      log().info << "No snapshot found, starting from genesis";
      return;
    }
    log().critical << "Unreadable snapshot, starting from genesis: "
                   << snapshot.error().message;
    recordSystemEvent("BLOCKCHAIN_INTEGRITY_FAILED",
                      "Unreadable snapshot on startup: " + snapshot.error().message);
    return;
  }

  if (!chain_->loadAndValidate(std::move(snapshot.value()))) {
    log().critical << "Snapshot rejected, continuing with genesis-only chain";
    recordSystemEvent("BLOCKCHAIN_INTEGRITY_FAILED",
                      "Integrity check failed on startup, snapshot refused");
  }
}

void LedgerService::recordSystemEvent(const std::string &event, const std::string &details) {
  registry_.recordSystemEvent(event, details, utl::getCurrentTimeMs());
  auto saved = registry_.save(registryPath_);
  if (!saved) {
    log().error << "Failed to persist " << event << " audit: " << saved.error().message;
  }
}

bool LedgerService::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chain_ != nullptr;
}

LedgerService::Roe<void> LedgerService::checkInitialized() const {
  if (!chain_) {
    return Error(E_STATE, "Service is not initialized");
  }
  return {};
}

LedgerService::Roe<LedgerService::SubmitReceipt>
LedgerService::submit(const ReportSubmission &submission) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = checkInitialized();
  if (!ready) {
    return ready.error();
  }

  auto prepared = intake_.prepare(submission);
  if (!prepared) {
    return Error(E_INVALID_INPUT, prepared.error().message);
  }
  PreparedReport &report = prepared.value();

  // Reference ids are citizen-facing and must stay unique
  uint32_t attempts = 1;
  while (registry_.hasReferenceId(report.referenceId)) {
    if (attempts >= MAX_REFERENCE_ATTEMPTS) {
      recordSystemEvent("REPORT_SUBMIT_FAILED", "No unused reference id after " +
                                                    std::to_string(attempts) + " draws");
      return Error(E_STATE, "No unused reference id available");
    }
    log().debug << "Reference id " << report.referenceId << " in use, drawing again";
    report.referenceId = intake_.nextReferenceId();
    attempts++;
  }

  Block block = chain_->append(report.payload);

  auto saved = store_->save(chain_->exportSnapshot());
  if (!saved) {
    std::string message = "Block " + std::to_string(block.index) +
                          " sealed but snapshot not saved: " + saved.error().message;
    recordSystemEvent("REPORT_SUBMIT_FAILED", message);
    return Error(E_PERSIST, message);
  }

  ReportRecord record;
  record.reportId = block.data.reportId;
  record.referenceId = report.referenceId;
  record.blockIndex = block.index;
  record.blockHash = block.hash;
  record.category = block.data.category;
  record.urgency = block.data.urgency;
  record.descriptionHash = block.data.descriptionHash;
  record.reporter = block.data.reporter;
  record.status = block.data.status;
  record.location = block.data.location;
  record.evidenceHashes = block.data.evidenceHashes;
  record.authorities = block.data.authorityRouted;
  record.isEmergency = report.isEmergency;
  record.aiSummary = report.aiSummary;
  record.createdAt = block.timestamp;
  record.updatedAt = block.timestamp;

  auto inserted = registry_.insert(record);
  if (!inserted) {
    recordSystemEvent("REPORT_SUBMIT_FAILED", inserted.error().message);
    return Error(E_PERSIST, inserted.error().message);
  }
  auto registrySaved = registry_.save(registryPath_);
  if (!registrySaved) {
    return Error(E_PERSIST, "Report registered but registry not saved: " +
                                registrySaved.error().message);
  }

  log().info << "Report " << record.reportId << " (" << record.referenceId
             << ") sealed in block " << block.index;
  if (!block.data.authorityRouted.empty()) {
    log().info << "Report " << record.reportId << " routed to "
               << utl::join(block.data.authorityRouted, ", ");
  }

  SubmitReceipt receipt;
  receipt.reportId = record.reportId;
  receipt.referenceId = record.referenceId;
  receipt.blockIndex = block.index;
  receipt.blockHash = block.hash;
  receipt.status = record.status;
  receipt.chainLength = chain_->length();
  receipt.submittedAt = utl::formatIsoTimestamp(block.timestamp);
  return receipt;
}

LedgerService::Roe<LedgerService::VerifyResult>
LedgerService::verify(const std::string &reportId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = checkInitialized();
  if (!ready) {
    return ready.error();
  }

  auto block = chain_->findByReportId(reportId);
  if (!block) {
    return Error(E_NOT_FOUND, "Report not found on chain: " + reportId);
  }

  VerifyResult result;
  result.reportId = reportId;
  result.chainIntact = chain_->isValid();
  result.index = block->index;
  result.hash = block->hash;
  result.previousHash = block->previousHash;
  result.timestamp = utl::formatIsoTimestamp(block->timestamp);
  result.nonce = block->nonce;
  result.dataHash = BlockChain::payloadDigest(block->data);
  return result;
}

LedgerService::Roe<LedgerService::HealthReport> LedgerService::health() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = checkInitialized();
  if (!ready) {
    return ready.error();
  }

  Block latest = chain_->latest();
  HealthReport report;
  report.healthy = chain_->isValid();
  report.chainLength = chain_->length();
  report.latestBlockIndex = latest.index;
  report.latestBlockHash = latest.hash;
  report.lastUpdated = utl::formatIsoTimestamp(latest.timestamp);
  if (!report.healthy) {
    log().critical << "Chain integrity check failed";
    recordSystemEvent("BLOCKCHAIN_INTEGRITY_FAILED", "Integrity check failed on health check");
  }
  return report;
}

LedgerService::Roe<ReportRecord> LedgerService::getReport(const std::string &reportId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = checkInitialized();
  if (!ready) {
    return ready.error();
  }

  auto record = registry_.get(reportId);
  if (!record) {
    return Error(E_NOT_FOUND, record.error().message);
  }
  return record.value();
}

LedgerService::Roe<std::vector<ReportRecord>>
LedgerService::listReports(const ReportFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = checkInitialized();
  if (!ready) {
    return ready.error();
  }
  return registry_.list(filter);
}

LedgerService::Roe<ReportRecord> LedgerService::updateStatus(const std::string &reportId,
                                                             ReportStatus status,
                                                             const std::string &actor) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = checkInitialized();
  if (!ready) {
    return ready.error();
  }

  auto updated = registry_.updateStatus(reportId, status, actor, utl::getCurrentTimeMs());
  if (!updated) {
    switch (updated.error().code) {
    case ReportRegistry::E_NOT_FOUND:
      return Error(E_NOT_FOUND, updated.error().message);
    case ReportRegistry::E_TRANSITION:
      return Error(E_TRANSITION, updated.error().message);
    default:
      return Error(E_PERSIST, updated.error().message);
    }
  }

  auto saved = registry_.save(registryPath_);
  if (!saved) {
    return Error(E_PERSIST, "Status changed but registry not saved: " +
                                saved.error().message);
  }
  return updated.value();
}

LedgerService::Roe<nlohmann::json> LedgerService::exportChain() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ready = checkInitialized();
  if (!ready) {
    return ready.error();
  }
  return FileSnapshotStore::toJson(chain_->exportSnapshot());
}

} // namespace cl
