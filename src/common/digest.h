#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Fleetshard {

constexpr size_t kSha256Bytes = 32;

/**
 * SHA-256 of data (OpenSSL EVP).
 * Throws std::runtime_error if libcrypto fails to produce a digest.
 */
std::array<uint8_t, kSha256Bytes> Sha256(std::string_view data);

/**
 * First 8 bytes of SHA-256(data), read as a big-endian unsigned integer.
 * Used both to seed the shuffle generator and as the rendezvous weight.
 */
uint64_t Sha256Prefix64(std::string_view data);

} // namespace Fleetshard
