#include "Utilities.h"

#include <charconv>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sodium.h>
#include <sstream>
#include <stdexcept>

namespace cl {
namespace utl {

// Initialize libsodium (safe to call multiple times)
namespace {
struct SodiumInitializer {
  SodiumInitializer() {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  }
};
static SodiumInitializer sodium_initializer;
} // namespace

int64_t getCurrentTimeMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string formatIsoTimestamp(int64_t unixMillis) {
  int64_t seconds = unixMillis / 1000;
  int64_t millis = unixMillis % 1000;
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }
  time_t t = static_cast<time_t>(seconds);
  std::tm utc{};
  if (gmtime_r(&t, &utc) == nullptr) {
    return std::to_string(unixMillis);
  }
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << millis << 'Z';
  return oss.str();
}

bool parseUInt64(const std::string &str, uint64_t &value) {
  auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
  return ec == std::errc{} && ptr == str.data() + str.size();
}

std::string join(const std::vector<std::string> &strings, const std::string &delimiter) {
  std::string result;
  for (size_t i = 0; i < strings.size(); ++i) {
    if (i > 0) {
      result += delimiter;
    }
    result += strings[i];
  }
  return result;
}

size_t utf8Length(const std::string &str) {
  size_t length = 0;
  for (char c : str) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      length++;
    }
  }
  return length;
}

std::string sha256(const std::string &input) {
  unsigned char hash[crypto_hash_sha256_BYTES];

  if (crypto_hash_sha256(hash,
                         reinterpret_cast<const unsigned char *>(input.data()),
                         input.size()) != 0) {
    throw std::runtime_error("crypto_hash_sha256 failed");
  }

  return hexEncode(std::string(reinterpret_cast<const char *>(hash), sizeof(hash)));
}

bool isSha256Hex(const std::string &str) {
  if (str.size() != crypto_hash_sha256_BYTES * 2) {
    return false;
  }
  for (char c : str) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

std::string hexEncode(const std::string &data) {
  std::stringstream ss;
  for (unsigned char c : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  }
  return ss.str();
}

std::string uuidV4() {
  unsigned char bytes[16];
  randombytes_buf(bytes, sizeof(bytes));
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40); // version 4
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80); // RFC 4122 variant

  std::string hex = hexEncode(std::string(reinterpret_cast<const char *>(bytes), sizeof(bytes)));
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

uint32_t randomInRange(uint32_t lower, uint32_t upper) {
  if (upper <= lower) {
    return lower;
  }
  return lower + randombytes_uniform(upper - lower + 1);
}

cl::Roe<std::string> readFile(const std::string &filePath) {
  std::ifstream file(filePath, std::ios::binary);
  if (!file.is_open()) {
    return Error(1, "Failed to open file: " + filePath);
  }
  std::string content((std::istreambuf_iterator<char>(file)),
                      std::istreambuf_iterator<char>());
  if (file.bad()) {
    return Error(2, "Failed to read file: " + filePath);
  }
  return content;
}

cl::Roe<nlohmann::json> loadJsonFile(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    return Error(1, "File not found: " + path);
  }

  auto content = readFile(path);
  if (!content) {
    return Error(2, content.error().message);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(content.value());
  } catch (const nlohmann::json::parse_error &e) {
    return Error(3, "Failed to parse JSON in " + path + ": " + std::string(e.what()));
  }

  return document;
}

cl::Roe<void> writeFileAtomic(const std::string &filePath, const std::string &content) {
  std::filesystem::path path(filePath);
  std::filesystem::path parentDir = path.parent_path();
  std::error_code ec;
  if (!parentDir.empty() && !std::filesystem::exists(parentDir, ec)) {
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(1, "Failed to create parent directories for " + filePath + ": " + ec.message());
    }
  }

  std::string tempPath = filePath + ".tmp";
  {
    std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return Error(2, "Failed to open file for writing: " + tempPath);
    }
    file << content;
    file.flush();
    if (!file.good()) {
      return Error(3, "Failed to write content to file: " + tempPath);
    }
  }

  std::filesystem::rename(tempPath, path, ec);
  if (ec) {
    std::string reason = ec.message();
    std::filesystem::remove(tempPath, ec);
    return Error(4, "Failed to replace " + filePath + ": " + reason);
  }

  return {};
}

} // namespace utl
} // namespace cl
