#include "digest.h"

#include <stdexcept>

#include <openssl/evp.h>

namespace Fleetshard {

std::array<uint8_t, kSha256Bytes> Sha256(std::string_view data) {
    std::array<uint8_t, kSha256Bytes> out{};
    unsigned int out_len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
            out_len != kSha256Bytes) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return out;
}

uint64_t Sha256Prefix64(std::string_view data) {
    auto hash = Sha256(data);
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value = (value << 8) | hash[i];
    }
    return value;
}

} // namespace Fleetshard
