#ifndef CIVIC_LEDGER_UTILITIES_H
#define CIVIC_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cl {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

/**
 * Format a millisecond epoch timestamp as ISO-8601 UTC,
 * e.g. "2024-01-01T00:00:00.000Z"
 */
std::string formatIsoTimestamp(int64_t unixMillis);

/**
 * Parse a 64-bit unsigned integer from a string
 * @return true if the whole string was a valid number
 */
bool parseUInt64(const std::string &str, uint64_t &value);

/**
 * Join a vector of strings with a delimiter
 */
std::string join(const std::vector<std::string> &strings, const std::string &delimiter);

/**
 * Number of UTF-8 code points in a string. Continuation bytes are not
 * counted, so malformed input still yields a bounded result.
 */
size_t utf8Length(const std::string &str);

/**
 * Compute SHA-256 using libsodium
 * @param input Input bytes
 * @return Lowercase hexadecimal digest (64 characters)
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Check that a string looks like a sha256() result: 64 lowercase hex chars
 */
bool isSha256Hex(const std::string &str);

/**
 * Encode binary data as lowercase hex
 */
std::string hexEncode(const std::string &data);

/**
 * Random UUID (version 4) from the libsodium CSPRNG
 */
std::string uuidV4();

/**
 * Uniform random integer in [lower, upper] from the libsodium CSPRNG
 */
uint32_t randomInRange(uint32_t lower, uint32_t upper);

/**
 * Read a whole file into a string
 * @return Roe<std::string> with the content or an error
 */
cl::Roe<std::string> readFile(const std::string &filePath);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Roe<nlohmann::json> with the parsed document or an error
 */
cl::Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Replace a file's content atomically: the content is written to a
 * sibling temporary file which is then renamed over the target.
 * Creates parent directories if needed.
 */
cl::Roe<void> writeFileAtomic(const std::string &filePath, const std::string &content);

} // namespace utl
} // namespace cl

#endif // CIVIC_LEDGER_UTILITIES_H
