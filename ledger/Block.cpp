#include "Block.h"
#include "Canonical.h"

#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <sstream>
#include <stdexcept>

namespace cl {

// SHA-256 using the OpenSSL 3.0 EVP API
static std::string sha256(const std::string &input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                &EVP_MD_CTX_free);
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hashLen = 0;

  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(mdctx.get(), input.data(), input.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  if (EVP_DigestFinal_ex(mdctx.get(), hash, &hashLen) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < hashLen; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

// ----------------- enum names -------------------------------------

std::string toString(Urgency urgency) {
  switch (urgency) {
  case Urgency::NONE:
    return "NONE";
  case Urgency::CRITICAL:
    return "Critical";
  case Urgency::HIGH:
    return "High";
  case Urgency::MEDIUM:
    return "Medium";
  case Urgency::LOW:
    return "Low";
  }
  return "NONE";
}

std::string toString(ReportStatus status) {
  switch (status) {
  case ReportStatus::PENDING:
    return "PENDING";
  case ReportStatus::UNDER_REVIEW:
    return "UNDER_REVIEW";
  case ReportStatus::RESOLVED:
    return "RESOLVED";
  case ReportStatus::DISMISSED:
    return "DISMISSED";
  }
  return "PENDING";
}

std::string toString(Identity identity) {
  return identity == Identity::NAMED ? "named" : "anonymous";
}

bool urgencyFromString(const std::string &str, Urgency &urgency) {
  static const Urgency all[] = {Urgency::NONE, Urgency::CRITICAL, Urgency::HIGH,
                                Urgency::MEDIUM, Urgency::LOW};
  for (Urgency candidate : all) {
    if (toString(candidate) == str) {
      urgency = candidate;
      return true;
    }
  }
  return false;
}

bool statusFromString(const std::string &str, ReportStatus &status) {
  static const ReportStatus all[] = {ReportStatus::PENDING, ReportStatus::UNDER_REVIEW,
                                     ReportStatus::RESOLVED, ReportStatus::DISMISSED};
  for (ReportStatus candidate : all) {
    if (toString(candidate) == str) {
      status = candidate;
      return true;
    }
  }
  return false;
}

bool identityFromString(const std::string &str, Identity &identity) {
  if (str == "named") {
    identity = Identity::NAMED;
    return true;
  }
  if (str == "anonymous") {
    identity = Identity::ANONYMOUS;
    return true;
  }
  return false;
}

// ----------------- BlockPayload -----------------------------------

bool BlockPayload::operator==(const BlockPayload &other) const {
  return reportId == other.reportId && category == other.category &&
         urgency == other.urgency && location == other.location &&
         descriptionHash == other.descriptionHash &&
         evidenceHashes == other.evidenceHashes && reporter == other.reporter &&
         timestamp == other.timestamp &&
         authorityRouted == other.authorityRouted && status == other.status;
}

nlohmann::json BlockPayload::toJson() const {
  nlohmann::json j;
  j["reportId"] = reportId;
  j["category"] = category;
  j["urgency"] = toString(urgency);
  j["location"] = {{"area", location.area},
                   {"address", location.address},
                   {"nearestStation", location.nearestStation}};
  j["descriptionHash"] = descriptionHash.hex();
  nlohmann::json evidence = nlohmann::json::array();
  for (const auto &digest : evidenceHashes) {
    evidence.push_back(digest.hex());
  }
  j["evidenceHashes"] = evidence;
  j["identity"] = toString(reporter.getIdentity());
  if (reporter.getCitizenId()) {
    j["citizenId"] = *reporter.getCitizenId();
  }
  j["timestamp"] = timestamp;
  j["authorityRouted"] = authorityRouted;
  j["status"] = toString(status);
  return j;
}

cl::Roe<BlockPayload> BlockPayload::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(1, "Payload must be a JSON object");
  }

  BlockPayload payload;
  try {
    payload.reportId = j.at("reportId").get<std::string>();
    payload.category = j.at("category").get<std::string>();

    if (!urgencyFromString(j.at("urgency").get<std::string>(), payload.urgency)) {
      return Error(2, "Unknown urgency: " + j.at("urgency").get<std::string>());
    }

    const auto &location = j.at("location");
    payload.location.area = location.at("area").get<std::string>();
    payload.location.address = location.at("address").get<std::string>();
    payload.location.nearestStation = location.at("nearestStation").get<std::string>();

    auto description = Digest::fromHex(j.at("descriptionHash").get<std::string>());
    if (!description) {
      return Error(3, "descriptionHash: " + description.error().message);
    }
    payload.descriptionHash = description.value();

    for (const auto &item : j.at("evidenceHashes")) {
      auto evidence = Digest::fromHex(item.get<std::string>());
      if (!evidence) {
        return Error(3, "evidenceHashes: " + evidence.error().message);
      }
      payload.evidenceHashes.push_back(evidence.value());
    }

    Identity identity;
    if (!identityFromString(j.at("identity").get<std::string>(), identity)) {
      return Error(4, "Unknown identity: " + j.at("identity").get<std::string>());
    }
    if (identity == Identity::ANONYMOUS) {
      if (j.contains("citizenId")) {
        return Error(5, "Anonymous payload must not carry a citizenId");
      }
      payload.reporter = Reporter::anonymous();
    } else {
      std::string citizenId = j.at("citizenId").get<std::string>();
      if (citizenId.empty()) {
        return Error(5, "Named payload requires a citizenId");
      }
      payload.reporter = Reporter::named(citizenId);
    }

    payload.timestamp = j.at("timestamp").get<int64_t>();
    payload.authorityRouted = j.at("authorityRouted").get<std::vector<std::string>>();

    if (!statusFromString(j.at("status").get<std::string>(), payload.status)) {
      return Error(6, "Unknown status: " + j.at("status").get<std::string>());
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(7, "Malformed payload: " + std::string(e.what()));
  }

  return payload;
}

// ----------------- Block ------------------------------------------

std::string Block::calculateHash() const {
  return computeHash(index, timestamp, data, previousHash, nonce);
}

std::string Block::computeHash(uint64_t index, int64_t timestamp,
                               const BlockPayload &data,
                               const std::string &previousHash, uint64_t nonce) {
  return hashEncoded(
      canonical::encodeBlock(index, timestamp, data, previousHash, nonce));
}

std::string Block::hashEncoded(const std::string &encoded) {
  return sha256(encoded);
}

bool Block::operator==(const Block &other) const {
  return index == other.index && timestamp == other.timestamp &&
         data == other.data && previousHash == other.previousHash &&
         hash == other.hash && nonce == other.nonce;
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["data"] = data.toJson();
  j["previousHash"] = previousHash;
  j["hash"] = hash;
  j["nonce"] = nonce;
  return j;
}

cl::Roe<Block> Block::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(1, "Block must be a JSON object");
  }

  Block block;
  try {
    block.index = j.at("index").get<uint64_t>();
    block.timestamp = j.at("timestamp").get<int64_t>();
    block.previousHash = j.at("previousHash").get<std::string>();
    block.hash = j.at("hash").get<std::string>();
    block.nonce = j.at("nonce").get<uint64_t>();
  } catch (const nlohmann::json::exception &e) {
    return Error(7, "Malformed block: " + std::string(e.what()));
  }

  if (!j.contains("data")) {
    return Error(7, "Malformed block: missing data");
  }
  auto payload = BlockPayload::fromJson(j.at("data"));
  if (!payload) {
    return Error(payload.error().code,
                 "Block " + std::to_string(block.index) + ": " + payload.error().message);
  }
  block.data = payload.value();
  return block;
}

} // namespace cl
