#ifndef RETIRECALC_RNG_HPP
#define RETIRECALC_RNG_HPP

#include <cstddef>
#include <cstdint>
#include <random>

namespace retirecalc {

// Independent random streams used by a scenario. Keeping them apart means
// toggling one model (e.g. LTC) leaves every other draw unchanged.
enum class StreamId : uint64_t {
    Returns = 1,
    Mortality = 2,
    LongTermCare = 3,
    Regime = 4,
    Stratification = 5,
    TailMixing = 6
};

// Deterministic generator owned by exactly one scenario
class RandomStream {
public:
    explicit RandomStream(uint64_t seed);

    // Uniform in [0, 1) with 53 bits of precision
    double uniform();

    // Uniform in [low, high)
    double uniform(double low, double high);

    // Standard normal via Box-Muller; the second variate is cached
    double normal();

    uint64_t next_u64() { return engine_(); }

private:
    std::mt19937_64 engine_;
    bool has_spare_;
    double spare_;
};

// Per-run context: derives scenario streams from (seed, scenario, stream)
// so results do not depend on scheduling across workers
class RngContext {
public:
    explicit RngContext(uint64_t seed);

    uint64_t seed() const { return seed_; }

    RandomStream stream(size_t scenario, StreamId id) const;

    static uint64_t derive_seed(uint64_t seed, size_t scenario, StreamId id);

private:
    uint64_t seed_;
};

// SplitMix64 finalizer
uint64_t splitmix64(uint64_t x);

} // namespace retirecalc

#endif // RETIRECALC_RNG_HPP
