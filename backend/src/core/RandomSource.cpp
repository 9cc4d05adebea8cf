#include "core/RandomSource.hpp"

namespace qkdnet {

static uint64_t entropy_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

Mt19937RandomSource::Mt19937RandomSource()
: seed_(entropy_seed()), rng_(seed_) {}

Mt19937RandomSource::Mt19937RandomSource(uint64_t seed)
: seed_(seed), rng_(seed) {}

uint64_t Mt19937RandomSource::next_u64() {
    return rng_();
}

uint64_t mix_seed(uint64_t x) {
    uint64_t z = x + 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

uint64_t derive_seed(uint64_t base, uint64_t stream) {
    return mix_seed(base ^ mix_seed(stream + 1));
}

uint64_t resolve_seed(const std::optional<uint64_t>& seed) {
    return seed ? *seed : entropy_seed();
}

} // namespace qkdnet
