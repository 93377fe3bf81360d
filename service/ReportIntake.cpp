#include "ReportIntake.h"
#include "../lib/Utilities.h"

#include <cctype>

namespace cl {

namespace {

bool isBlank(const std::string &str) {
  for (char c : str) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

bool parseIdentity(const std::string &str, Identity &identity) {
  // "name" is what the reporting app sends for a named report
  if (str == "name") {
    identity = Identity::NAMED;
    return true;
  }
  return identityFromString(str, identity);
}

} // namespace

cl::Roe<ReportSubmission> ReportSubmission::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(1, "Report must be a JSON object");
  }

  ReportSubmission submission;
  try {
    submission.category = j.value("category", "");
    submission.urgency = j.value("urgency", "");
    submission.description = j.value("description", "");
    submission.identity = j.value("identity", "");
    submission.citizenId = j.value("citizenId", "");
    if (j.contains("location")) {
      const auto &location = j.at("location");
      if (!location.is_object()) {
        return Error(1, "location must be an object");
      }
      submission.location.area = location.value("area", "");
      submission.location.address = location.value("address", "");
      submission.location.nearestStation = location.value("nearestStation", "");
    }
    if (j.contains("evidence")) {
      submission.evidence = j.at("evidence").get<std::vector<std::string>>();
    }
    if (j.contains("authorities")) {
      submission.authorities = j.at("authorities").get<std::vector<std::string>>();
    }
    submission.aiSummary = j.value("aiSummary", "");
    submission.isEmergency = j.value("isEmergency", false);
  } catch (const nlohmann::json::exception &e) {
    return Error(2, "Malformed report: " + std::string(e.what()));
  }
  return submission;
}

ReportIntake::ReportIntake()
    : Module("civic.service.intake"), referenceSource_(&ReportIntake::makeReferenceId) {}

void ReportIntake::setReferenceSource(std::function<std::string()> source) {
  referenceSource_ = source ? std::move(source) : &ReportIntake::makeReferenceId;
}

std::string ReportIntake::nextReferenceId() const { return referenceSource_(); }

ReportIntake::Roe<void> ReportIntake::validate(const ReportSubmission &submission) const {
  if (isBlank(submission.category)) {
    return Error(E_INVALID_INPUT, "Category is required");
  }

  Urgency urgency;
  if (!urgencyFromString(submission.urgency, urgency) || urgency == Urgency::NONE) {
    return Error(E_INVALID_INPUT, "Invalid urgency level");
  }

  if (utl::utf8Length(submission.description) < MIN_DESCRIPTION_LENGTH) {
    return Error(E_INVALID_INPUT, "Description must be at least " +
                                      std::to_string(MIN_DESCRIPTION_LENGTH) +
                                      " characters");
  }

  Identity identity;
  if (!parseIdentity(submission.identity, identity)) {
    return Error(E_INVALID_INPUT, "Identity must be named or anonymous");
  }
  if (identity == Identity::NAMED && isBlank(submission.citizenId)) {
    return Error(E_INVALID_INPUT, "Named reports require a citizenId");
  }

  if (isBlank(submission.location.area)) {
    return Error(E_INVALID_INPUT, "Location area is required");
  }
  if (isBlank(submission.location.address)) {
    return Error(E_INVALID_INPUT, "Location address is required");
  }
  if (isBlank(submission.location.nearestStation)) {
    return Error(E_INVALID_INPUT, "Nearest station is required");
  }

  return {};
}

ReportIntake::Roe<PreparedReport>
ReportIntake::prepare(const ReportSubmission &submission) const {
  auto valid = validate(submission);
  if (!valid) {
    log().warning << "Rejected submission: " << valid.error().message;
    return valid.error();
  }

  PreparedReport prepared;
  BlockPayload &payload = prepared.payload;
  payload.reportId = utl::uuidV4();
  payload.category = submission.category;
  urgencyFromString(submission.urgency, payload.urgency);
  payload.location = submission.location;
  payload.descriptionHash = Digest::of(submission.description);
  for (const auto &evidence : submission.evidence) {
    payload.evidenceHashes.push_back(Digest::of(evidence));
  }

  Identity identity = Identity::ANONYMOUS;
  parseIdentity(submission.identity, identity);
  if (identity == Identity::NAMED) {
    payload.reporter = Reporter::named(submission.citizenId);
  } else {
    if (!submission.citizenId.empty()) {
      log().warning << "Dropped citizenId from anonymous report " << payload.reportId;
    }
    payload.reporter = Reporter::anonymous();
  }

  payload.timestamp = 0;
  payload.authorityRouted = submission.authorities;
  payload.status = ReportStatus::PENDING;

  prepared.referenceId = nextReferenceId();
  prepared.aiSummary = submission.aiSummary;
  prepared.isEmergency = submission.isEmergency;

  log().debug << "Prepared report " << payload.reportId << " ("
              << toString(payload.urgency) << ", " << payload.category << ")";
  return prepared;
}

std::string ReportIntake::makeReferenceId() {
  return "#IND-" + std::to_string(utl::randomInRange(REFERENCE_MIN, REFERENCE_MAX)) + "-X";
}

bool ReportIntake::isValidReferenceId(const std::string &referenceId) {
  // #IND-NNNNN-X
  if (referenceId.size() != 12 || referenceId.compare(0, 5, "#IND-") != 0 ||
      referenceId.compare(10, 2, "-X") != 0) {
    return false;
  }
  uint64_t number = 0;
  if (!utl::parseUInt64(referenceId.substr(5, 5), number)) {
    return false;
  }
  return number >= REFERENCE_MIN && number <= REFERENCE_MAX;
}

} // namespace cl
