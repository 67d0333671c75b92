#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Fleetshard {

/**
 * Derives the 64-bit shuffle seed from a seed string:
 * the first 8 bytes of SHA-256(seed), big-endian.
 */
uint64_t DeriveSeed(const std::string& seed);

/**
 * Reproducible random source for the shuffle.
 * std::mt19937_64 output is fixed by the standard; the bounded draw below
 * is done here instead of std::uniform_int_distribution, whose algorithm
 * differs between standard libraries.
 */
class DeterministicRng {
public:
    explicit DeterministicRng(uint64_t seed) : engine_(seed) {}

    // Uniform value in [0, n). n must be > 0.
    uint64_t UniformBelow(uint64_t n);

private:
    std::mt19937_64 engine_;
};

/**
 * Orders ids for distribution.
 * Empty seed: ids are returned unchanged, in their given order.
 * Otherwise ids are sorted numerically and then Fisher-Yates shuffled with
 * DeterministicRng(DeriveSeed(seed)), so the same seed and the same set of
 * ids give the same sequence whatever order the ids arrived in.
 */
std::vector<std::string> SequenceIds(const std::vector<std::string>& ids, const std::string& seed);

} // namespace Fleetshard
