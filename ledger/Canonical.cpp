#include "Canonical.h"

namespace cl {
namespace canonical {

namespace {

class Encoder {
public:
  Encoder &putString(const std::string &value) {
    out_ += std::to_string(value.size());
    out_ += ':';
    out_ += value;
    return *this;
  }

  Encoder &putInt(int64_t value) {
    out_ += '#';
    out_ += std::to_string(value);
    out_ += ';';
    return *this;
  }

  Encoder &putUInt(uint64_t value) {
    out_ += '#';
    out_ += std::to_string(value);
    out_ += ';';
    return *this;
  }

  Encoder &putListHeader(size_t count) {
    out_ += '*';
    out_ += std::to_string(count);
    out_ += ';';
    return *this;
  }

  Encoder &putAbsent() {
    out_ += '~';
    return *this;
  }

  Encoder &putRaw(const std::string &encoded) {
    out_ += encoded;
    return *this;
  }

  std::string take() { return std::move(out_); }

private:
  std::string out_;
};

} // namespace

std::string encodePayload(const BlockPayload &payload) {
  Encoder enc;
  enc.putString(payload.reportId)
      .putString(payload.category)
      .putString(toString(payload.urgency))
      .putString(payload.location.area)
      .putString(payload.location.address)
      .putString(payload.location.nearestStation)
      .putString(payload.descriptionHash.hex());

  enc.putListHeader(payload.evidenceHashes.size());
  for (const auto &evidence : payload.evidenceHashes) {
    enc.putString(evidence.hex());
  }

  enc.putString(toString(payload.reporter.getIdentity()));
  if (payload.reporter.getCitizenId()) {
    enc.putString(*payload.reporter.getCitizenId());
  } else {
    enc.putAbsent();
  }

  enc.putInt(payload.timestamp);

  enc.putListHeader(payload.authorityRouted.size());
  for (const auto &authority : payload.authorityRouted) {
    enc.putString(authority);
  }

  enc.putString(toString(payload.status));
  return enc.take();
}

std::string encodeBlockPrefix(uint64_t index, int64_t timestamp,
                              const BlockPayload &payload,
                              const std::string &previousHash) {
  Encoder enc;
  enc.putRaw(VERSION_TAG)
      .putUInt(index)
      .putInt(timestamp)
      .putRaw(encodePayload(payload))
      .putString(previousHash);
  return enc.take();
}

std::string encodeNonce(uint64_t nonce) {
  Encoder enc;
  enc.putUInt(nonce);
  return enc.take();
}

std::string encodeBlock(uint64_t index, int64_t timestamp,
                        const BlockPayload &payload,
                        const std::string &previousHash, uint64_t nonce) {
  return encodeBlockPrefix(index, timestamp, payload, previousHash) +
         encodeNonce(nonce);
}

} // namespace canonical
} // namespace cl
