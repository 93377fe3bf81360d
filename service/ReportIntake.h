#pragma once

#include "../ledger/Block.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cl {

/**
 * A report as submitted by a citizen, before validation.
 * Holds raw free text; it never reaches the chain as is.
 */
struct ReportSubmission {
  std::string category;
  std::string urgency;     // Critical | High | Medium | Low
  std::string description; // raw text, hashed at intake
  std::string identity;    // named | anonymous ("name" is accepted for named)
  std::string citizenId;
  Location location;
  std::vector<std::string> evidence; // evidence content references, hashed at intake
  std::vector<std::string> authorities;
  std::string aiSummary;
  bool isEmergency{ false };

  /**
   * Structural decode only; content rules are checked by ReportIntake
   */
  static cl::Roe<ReportSubmission> fromJson(const nlohmann::json &j);
};

/**
 * Output of intake: the payload ready for sealing plus the metadata that
 * stays off chain
 */
struct PreparedReport {
  BlockPayload payload;
  std::string referenceId;
  std::string aiSummary;
  bool isEmergency{ false };
};

/**
 * Turns untrusted submissions into block payloads: validates the fields,
 * hashes description and evidence, applies the anonymity policy and
 * assigns report and reference ids.
 */
class ReportIntake : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_INPUT = 1;

  // Counted in characters, not bytes
  constexpr static size_t MIN_DESCRIPTION_LENGTH = 10;
  constexpr static uint32_t REFERENCE_MIN = 10000;
  constexpr static uint32_t REFERENCE_MAX = 99999;

  ReportIntake();
  ~ReportIntake() override = default;

  Roe<void> validate(const ReportSubmission &submission) const;

  /**
   * Validate and build the payload. The payload timestamp is left at 0 so
   * the chain stamps it with the sealing instant.
   */
  Roe<PreparedReport> prepare(const ReportSubmission &submission) const;

  /**
   * "#IND-NNNNN-X" with NNNNN drawn uniformly from 10000..99999
   */
  static std::string makeReferenceId();

  static bool isValidReferenceId(const std::string &referenceId);

  /**
   * Replace the reference id generator. An empty function restores
   * makeReferenceId.
   */
  void setReferenceSource(std::function<std::string()> source);

  std::string nextReferenceId() const;

private:
  std::function<std::string()> referenceSource_;
};

} // namespace cl
