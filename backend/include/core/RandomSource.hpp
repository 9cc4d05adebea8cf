#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <random>

namespace qkdnet {

/**
 * @brief Injectable source of uniform 64-bit words.
 *
 * Every prepare / intercept / measure step draws from one of these. Concrete
 * sources implement next_u64(); the helpers below derive all other draws from
 * it so a given word sequence always yields the same simulation.
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;
    /** @brief Next uniformly distributed 64-bit word */
    virtual uint64_t next_u64() = 0;

    /** @brief Fair coin: 0 or 1 */
    int bit() { return static_cast<int>(next_u64() & 1u); }
    /** @brief Uniform double in [0, 1) with 53 bits of precision */
    double uniform01() { return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0); }
    /** @brief True with probability p */
    bool bernoulli(double p) { return uniform01() < p; }
    /** @brief Uniform index in [0, n); n must be > 0 */
    // plain modulo; the bias is below n/2^64 and accepted for the small n drawn here
    size_t below(size_t n) { return static_cast<size_t>(next_u64() % n); }
};

class Mt19937RandomSource : public RandomSource {
public:
    // unseeded sources draw their seed from std::random_device
    Mt19937RandomSource();
    explicit Mt19937RandomSource(uint64_t seed);

    uint64_t next_u64() override;
    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 rng_;
};

// splitmix64 finalizer
uint64_t mix_seed(uint64_t x);

// Independent sub-stream seed for (base, stream). Used for per-link and
// per-scenario streams so results do not depend on execution order.
uint64_t derive_seed(uint64_t base, uint64_t stream);

// Resolve an optional seed into a concrete one (random_device when absent).
uint64_t resolve_seed(const std::optional<uint64_t>& seed);

} // namespace qkdnet
