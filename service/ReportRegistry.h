#pragma once

#include "../ledger/Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cl {

struct AuditEntry {
  // Per report: REPORT_SUBMITTED | STATUS_UPDATED
  // System: REPORT_SUBMIT_FAILED | BLOCKCHAIN_INTEGRITY_FAILED
  std::string event;
  std::string actor;
  std::string details;
  int64_t timestamp{ 0 };

  nlohmann::json toJson() const;
  static cl::Roe<AuditEntry> fromJson(const nlohmann::json &j);
};

/**
 * Off-chain view of a sealed report. Unlike the block it can change:
 * status moves through the review workflow and every change is audited.
 */
struct ReportRecord {
  std::string reportId;
  std::string referenceId;
  uint64_t blockIndex{ 0 };
  std::string blockHash;
  std::string category;
  Urgency urgency{ Urgency::NONE };
  Digest descriptionHash;
  Reporter reporter;
  ReportStatus status{ ReportStatus::PENDING };
  Location location;
  std::vector<Digest> evidenceHashes; // listed as evidence_1, evidence_2, ...
  std::vector<std::string> authorities;
  bool isEmergency{ false };
  std::string aiSummary;
  int64_t createdAt{ 0 };
  int64_t updatedAt{ 0 };
  std::vector<AuditEntry> auditTrail;

  nlohmann::json toJson() const;
  static cl::Roe<ReportRecord> fromJson(const nlohmann::json &j);
};

struct ReportFilter {
  std::optional<ReportStatus> status;
  std::optional<Urgency> urgency;
  size_t limit{ 50 };
  size_t offset{ 0 };
};

class ReportRegistry : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1;
  constexpr static int32_t E_DUPLICATE = 2;
  constexpr static int32_t E_TRANSITION = 3;
  constexpr static int32_t E_IO = 4;
  constexpr static int32_t E_FORMAT = 5;

  constexpr static uint32_t FORMAT_VERSION = 1;

  ReportRegistry();
  ~ReportRegistry() override = default;

  /**
   * PENDING -> UNDER_REVIEW | DISMISSED, UNDER_REVIEW -> RESOLVED | DISMISSED
   */
  static bool isTransitionAllowed(ReportStatus from, ReportStatus to);

  /**
   * Add a new record and its REPORT_SUBMITTED audit entry. Both the report
   * id and the reference id must be unused.
   */
  Roe<void> insert(ReportRecord record);

  bool hasReferenceId(const std::string &referenceId) const;

  Roe<ReportRecord> get(const std::string &reportId) const;

  /**
   * Records matching the filter, newest first
   */
  std::vector<ReportRecord> list(const ReportFilter &filter) const;

  size_t size() const;

  /**
   * Move a report to a new status and audit the change
   * @return The updated record
   */
  Roe<ReportRecord> updateStatus(const std::string &reportId, ReportStatus status,
                                 const std::string &actor, int64_t timestamp);

  /**
   * Audit an event that is not tied to a single report. Actor is SYSTEM.
   */
  void recordSystemEvent(const std::string &event, const std::string &details,
                         int64_t timestamp);

  std::vector<AuditEntry> getSystemEvents() const;

  Roe<void> save(const std::string &path) const;

  /**
   * Replace the registry content with the file's. A missing file yields an
   * empty registry.
   */
  Roe<void> load(const std::string &path);

private:
  mutable std::mutex mutex_;
  // Insertion order; list() walks it backwards
  std::vector<ReportRecord> records_;
  std::map<std::string, size_t> index_;
  std::set<std::string> referenceIds_;
  std::vector<AuditEntry> systemEvents_;
};

} // namespace cl
