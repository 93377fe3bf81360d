#include "ReportRegistry.h"
#include "../lib/Utilities.h"

#include <filesystem>

namespace cl {

// ----------------- AuditEntry -------------------------------------

nlohmann::json AuditEntry::toJson() const {
  nlohmann::json j;
  j["event"] = event;
  j["actor"] = actor;
  j["details"] = details;
  j["timestamp"] = timestamp;
  return j;
}

cl::Roe<AuditEntry> AuditEntry::fromJson(const nlohmann::json &j) {
  AuditEntry entry;
  try {
    entry.event = j.at("event").get<std::string>();
    entry.actor = j.at("actor").get<std::string>();
    entry.details = j.at("details").get<std::string>();
    entry.timestamp = j.at("timestamp").get<int64_t>();
  } catch (const nlohmann::json::exception &e) {
    return Error(1, "Malformed audit entry: " + std::string(e.what()));
  }
  return entry;
}

// ----------------- ReportRecord -----------------------------------

nlohmann::json ReportRecord::toJson() const {
  nlohmann::json j;
  j["reportId"] = reportId;
  j["referenceId"] = referenceId;
  j["blockIndex"] = blockIndex;
  j["blockHash"] = blockHash;
  j["category"] = category;
  j["urgency"] = toString(urgency);
  j["descriptionHash"] = descriptionHash.hex();
  j["identity"] = toString(reporter.getIdentity());
  if (reporter.getCitizenId()) {
    j["citizenId"] = *reporter.getCitizenId();
  }
  j["status"] = toString(status);
  j["location"] = {{"area", location.area},
                   {"address", location.address},
                   {"nearestStation", location.nearestStation}};
  nlohmann::json evidence = nlohmann::json::array();
  for (size_t i = 0; i < evidenceHashes.size(); ++i) {
    evidence.push_back({{"name", "evidence_" + std::to_string(i + 1)},
                        {"hash", evidenceHashes[i].hex()}});
  }
  j["evidence"] = evidence;
  j["authorities"] = authorities;
  j["isEmergency"] = isEmergency;
  j["aiSummary"] = aiSummary;
  j["createdAt"] = createdAt;
  j["updatedAt"] = updatedAt;
  nlohmann::json trail = nlohmann::json::array();
  for (const auto &entry : auditTrail) {
    trail.push_back(entry.toJson());
  }
  j["auditTrail"] = trail;
  return j;
}

cl::Roe<ReportRecord> ReportRecord::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(1, "Report record must be a JSON object");
  }

  ReportRecord record;
  try {
    record.reportId = j.at("reportId").get<std::string>();
    record.referenceId = j.at("referenceId").get<std::string>();
    record.blockIndex = j.at("blockIndex").get<uint64_t>();
    record.blockHash = j.at("blockHash").get<std::string>();
    record.category = j.at("category").get<std::string>();
    if (!urgencyFromString(j.at("urgency").get<std::string>(), record.urgency)) {
      return Error(2, "Unknown urgency in record " + record.reportId);
    }

    auto description = Digest::fromHex(j.at("descriptionHash").get<std::string>());
    if (!description) {
      return Error(3, "Record " + record.reportId + ": " + description.error().message);
    }
    record.descriptionHash = description.value();

    Identity identity;
    if (!identityFromString(j.at("identity").get<std::string>(), identity)) {
      return Error(4, "Unknown identity in record " + record.reportId);
    }
    if (identity == Identity::NAMED) {
      record.reporter = Reporter::named(j.at("citizenId").get<std::string>());
    } else if (j.contains("citizenId")) {
      return Error(5, "Anonymous record " + record.reportId + " carries a citizenId");
    }

    if (!statusFromString(j.at("status").get<std::string>(), record.status)) {
      return Error(6, "Unknown status in record " + record.reportId);
    }

    const auto &location = j.at("location");
    record.location.area = location.at("area").get<std::string>();
    record.location.address = location.at("address").get<std::string>();
    record.location.nearestStation = location.at("nearestStation").get<std::string>();

    if (j.contains("evidence")) {
      for (const auto &item : j.at("evidence")) {
        auto hash = Digest::fromHex(item.at("hash").get<std::string>());
        if (!hash) {
          return Error(8, "Record " + record.reportId + " evidence: " + hash.error().message);
        }
        record.evidenceHashes.push_back(hash.value());
      }
    }
    if (j.contains("authorities")) {
      record.authorities = j.at("authorities").get<std::vector<std::string>>();
    }

    record.isEmergency = j.at("isEmergency").get<bool>();
    record.aiSummary = j.at("aiSummary").get<std::string>();
    record.createdAt = j.at("createdAt").get<int64_t>();
    record.updatedAt = j.at("updatedAt").get<int64_t>();

    for (const auto &item : j.at("auditTrail")) {
      auto entry = AuditEntry::fromJson(item);
      if (!entry) {
        return Error(7, entry.error().message);
      }
      record.auditTrail.push_back(entry.value());
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(7, "Malformed report record: " + std::string(e.what()));
  }
  return record;
}

// ----------------- ReportRegistry ---------------------------------

ReportRegistry::ReportRegistry() : Module("civic.service.registry") {}

bool ReportRegistry::isTransitionAllowed(ReportStatus from, ReportStatus to) {
  switch (from) {
  case ReportStatus::PENDING:
    return to == ReportStatus::UNDER_REVIEW || to == ReportStatus::DISMISSED;
  case ReportStatus::UNDER_REVIEW:
    return to == ReportStatus::RESOLVED || to == ReportStatus::DISMISSED;
  case ReportStatus::RESOLVED:
  case ReportStatus::DISMISSED:
    return false;
  }
  return false;
}

ReportRegistry::Roe<void> ReportRegistry::insert(ReportRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index_.count(record.reportId) > 0) {
    return Error(E_DUPLICATE, "Report already registered: " + record.reportId);
  }
  if (referenceIds_.count(record.referenceId) > 0) {
    return Error(E_DUPLICATE, "Reference id already in use: " + record.referenceId);
  }

  AuditEntry entry;
  entry.event = "REPORT_SUBMITTED";
  entry.actor = record.reporter.isAnonymous() ? "ANONYMOUS" : *record.reporter.getCitizenId();
  entry.details = "New " + toString(record.urgency) + " urgency report in category: " +
                  record.category;
  entry.timestamp = record.createdAt;
  record.auditTrail.push_back(entry);

  index_[record.reportId] = records_.size();
  referenceIds_.insert(record.referenceId);
  records_.push_back(std::move(record));
  log().debug << "Registered report " << records_.back().reportId << " as "
              << records_.back().referenceId;
  return {};
}

bool ReportRegistry::hasReferenceId(const std::string &referenceId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return referenceIds_.count(referenceId) > 0;
}

ReportRegistry::Roe<ReportRecord> ReportRegistry::get(const std::string &reportId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(reportId);
  if (it == index_.end()) {
    return Error(E_NOT_FOUND, "Report not found: " + reportId);
  }
  return records_[it->second];
}

std::vector<ReportRecord> ReportRegistry::list(const ReportFilter &filter) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ReportRecord> result;
  size_t skipped = 0;
  for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
    if (result.size() >= filter.limit) {
      break;
    }
    if (filter.status && it->status != *filter.status) {
      continue;
    }
    if (filter.urgency && it->urgency != *filter.urgency) {
      continue;
    }
    if (skipped < filter.offset) {
      skipped++;
      continue;
    }
    result.push_back(*it);
  }
  return result;
}

size_t ReportRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

ReportRegistry::Roe<ReportRecord>
ReportRegistry::updateStatus(const std::string &reportId, ReportStatus status,
                             const std::string &actor, int64_t timestamp) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(reportId);
  if (it == index_.end()) {
    return Error(E_NOT_FOUND, "Report not found: " + reportId);
  }

  ReportRecord &record = records_[it->second];
  if (!isTransitionAllowed(record.status, status)) {
    return Error(E_TRANSITION, "Cannot move report from " + toString(record.status) +
                                   " to " + toString(status));
  }

  AuditEntry entry;
  entry.event = "STATUS_UPDATED";
  entry.actor = actor;
  entry.details = "Status changed from " + toString(record.status) + " to " + toString(status);
  entry.timestamp = timestamp;
  record.auditTrail.push_back(entry);
  record.status = status;
  record.updatedAt = timestamp;

  log().info << "Report " << reportId << ": " << entry.details;
  return record;
}

void ReportRegistry::recordSystemEvent(const std::string &event, const std::string &details,
                                       int64_t timestamp) {
  AuditEntry entry;
  entry.event = event;
  entry.actor = "SYSTEM";
  entry.details = details;
  entry.timestamp = timestamp;

  std::lock_guard<std::mutex> lock(mutex_);
  systemEvents_.push_back(entry);
  log().warning << event << ": " << details;
}

std::vector<AuditEntry> ReportRegistry::getSystemEvents() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return systemEvents_;
}

ReportRegistry::Roe<void> ReportRegistry::save(const std::string &path) const {
  nlohmann::json document;
  document["version"] = FORMAT_VERSION;
  nlohmann::json reports = nlohmann::json::array();
  nlohmann::json events = nlohmann::json::array();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &record : records_) {
      reports.push_back(record.toJson());
    }
    for (const auto &entry : systemEvents_) {
      events.push_back(entry.toJson());
    }
  }
  document["reports"] = reports;
  document["systemEvents"] = events;

  auto result = utl::writeFileAtomic(path, document.dump(2));
  if (!result) {
    log().error << "Failed to save registry: " << result.error().message;
    return Error(E_IO, result.error().message);
  }
  return {};
}

ReportRegistry::Roe<void> ReportRegistry::load(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    index_.clear();
    referenceIds_.clear();
    systemEvents_.clear();
    log().info << "No registry at " << path << ", starting empty";
    return {};
  }

  auto document = utl::loadJsonFile(path);
  if (!document) {
    return Error(E_FORMAT, document.error().message);
  }
  const auto &j = document.value();
  if (!j.is_object() || !j.contains("version") || !j["version"].is_number_unsigned() ||
      j["version"].get<uint32_t>() != FORMAT_VERSION || !j.contains("reports") ||
      !j["reports"].is_array()) {
    return Error(E_FORMAT, "Unsupported registry file: " + path);
  }

  std::vector<ReportRecord> records;
  std::map<std::string, size_t> index;
  std::set<std::string> referenceIds;
  for (const auto &item : j["reports"]) {
    auto record = ReportRecord::fromJson(item);
    if (!record) {
      return Error(E_FORMAT, record.error().message);
    }
    if (index.count(record.value().reportId) > 0) {
      return Error(E_FORMAT, "Duplicate report in registry: " + record.value().reportId);
    }
    if (!referenceIds.insert(record.value().referenceId).second) {
      return Error(E_FORMAT, "Duplicate reference id in registry: " +
                                 record.value().referenceId);
    }
    index[record.value().reportId] = records.size();
    records.push_back(record.value());
  }

  std::vector<AuditEntry> events;
  if (j.contains("systemEvents")) {
    if (!j["systemEvents"].is_array()) {
      return Error(E_FORMAT, "Unsupported registry file: " + path);
    }
    for (const auto &item : j["systemEvents"]) {
      auto entry = AuditEntry::fromJson(item);
      if (!entry) {
        return Error(E_FORMAT, entry.error().message);
      }
      events.push_back(entry.value());
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  records_ = std::move(records);
  index_ = std::move(index);
  referenceIds_ = std::move(referenceIds);
  systemEvents_ = std::move(events);
  log().info << "Loaded " << records_.size() << " reports from " << path;
  return {};
}

} // namespace cl
