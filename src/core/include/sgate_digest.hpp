#ifndef SGATE_DIGEST_HPP
#define SGATE_DIGEST_HPP

#include <string>

namespace sgate {

/// Length in hex characters of content_hash() output.
constexpr size_t CONTENT_HASH_HEX_LEN = 64;

/**
 * @brief BLAKE2b-256 of `data`, lower-case hex
 *
 * Used as the identity of a canonical rule set: equal hashes mean the
 * packet filter does not need a reload.
 */
std::string content_hash(const std::string& data);

} // namespace sgate

#endif // SGATE_DIGEST_HPP
