/**
 * @file digest.cpp
 * @brief Content hashing for canonical rule sets
 * @note libsodium is REQUIRED - no fallback implementations
 */

#include "../include/sgate_digest.hpp"

#include <stdexcept>
#include <vector>

#ifndef HAVE_SODIUM
#error "libsodium is required for content hashing. Please install libsodium and rebuild with -DHAVE_SODIUM=ON"
#endif

#include <sodium.h>

namespace sgate {

namespace {

void init_libsodium() {
    static const int rc = sodium_init();
    if (rc < 0) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

} // anonymous namespace

std::string content_hash(const std::string& data) {
    init_libsodium();

    unsigned char out[crypto_generichash_BYTES];
    if (crypto_generichash(out, sizeof(out),
                           reinterpret_cast<const unsigned char*>(data.data()),
                           data.size(), nullptr, 0) != 0) {
        throw std::runtime_error("crypto_generichash failed");
    }

    std::vector<char> hex(sizeof(out) * 2 + 1);
    sodium_bin2hex(hex.data(), hex.size(), out, sizeof(out));
    return std::string(hex.data());
}

} // namespace sgate
