#include "deterministic_sequencer.h"

#include <utility>

#include "../common/digest.h"
#include "../common/identifier.h"

namespace Fleetshard {

uint64_t DeriveSeed(const std::string& seed) {
    return Sha256Prefix64(seed);
}

uint64_t DeterministicRng::UniformBelow(uint64_t n) {
    // Reject the low (2^64 mod n) values so every residue is equally likely
    const uint64_t threshold = (0 - n) % n;
    for (;;) {
        uint64_t r = engine_();
        if (r >= threshold) {
            return r % n;
        }
    }
}

std::vector<std::string> SequenceIds(const std::vector<std::string>& ids, const std::string& seed) {
    if (seed.empty()) {
        return ids;
    }

    std::vector<std::string> sequenced = ids;
    SortNumerically(sequenced);

    DeterministicRng rng(DeriveSeed(seed));
    for (size_t i = sequenced.size(); i-- > 1;) {
        size_t j = static_cast<size_t>(rng.UniformBelow(i + 1));
        std::swap(sequenced[i], sequenced[j]);
    }
    return sequenced;
}

} // namespace Fleetshard
