#pragma once

#include "Block.h"

#include <cstdint>
#include <string>

namespace cl {
namespace canonical {

/**
 * Canonical text encoding used as hash input. Format version CL1:
 *
 *   "CL1|" index timestamp payload previousHash nonce
 *
 * where every string is "<byte length>:<bytes>", every integer is
 * "#<decimal>;", a list is "*<count>;" followed by its items and an
 * absent optional value is "~". Payload fields follow the declaration
 * order of BlockPayload. The encoding never depends on a JSON library.
 *
 * Changing any of this changes every block hash: bump the version tag.
 */
constexpr const char *VERSION_TAG = "CL1|";

/**
 * Encode a payload on its own
 */
std::string encodePayload(const BlockPayload &payload);

/**
 * Encode everything the block hash covers except the nonce
 */
std::string encodeBlockPrefix(uint64_t index, int64_t timestamp,
                              const BlockPayload &payload,
                              const std::string &previousHash);

/**
 * Encoding of the nonce, appended to the prefix
 */
std::string encodeNonce(uint64_t nonce);

/**
 * Full encoding: encodeBlockPrefix(...) + encodeNonce(nonce)
 */
std::string encodeBlock(uint64_t index, int64_t timestamp,
                        const BlockPayload &payload,
                        const std::string &previousHash, uint64_t nonce);

} // namespace canonical
} // namespace cl
