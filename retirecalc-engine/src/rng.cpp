#include "rng.hpp"
#include <cmath>

namespace retirecalc {

namespace {
constexpr double TWO_PI = 6.283185307179586476925286766559;
constexpr double INV_2_POW_53 = 1.0 / 9007199254740992.0;
}

uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

// ============================================================================
// RandomStream Implementation
// ============================================================================

RandomStream::RandomStream(uint64_t seed)
    : engine_(seed), has_spare_(false), spare_(0.0) {}

double RandomStream::uniform() {
    return static_cast<double>(engine_() >> 11) * INV_2_POW_53;
}

double RandomStream::uniform(double low, double high) {
    return low + (high - low) * uniform();
}

double RandomStream::normal() {
    if (has_spare_) {
        has_spare_ = false;
        return spare_;
    }
    // 1 - u keeps the log argument in (0, 1]
    double u1 = 1.0 - uniform();
    double u2 = uniform();
    double radius = std::sqrt(-2.0 * std::log(u1));
    double angle = TWO_PI * u2;
    spare_ = radius * std::sin(angle);
    has_spare_ = true;
    return radius * std::cos(angle);
}

// ============================================================================
// RngContext Implementation
// ============================================================================

RngContext::RngContext(uint64_t seed)
    : seed_(seed) {}

uint64_t RngContext::derive_seed(uint64_t seed, size_t scenario, StreamId id) {
    uint64_t key = splitmix64(static_cast<uint64_t>(scenario) * 0x100000001b3ULL +
                              static_cast<uint64_t>(id));
    return splitmix64(seed ^ key);
}

RandomStream RngContext::stream(size_t scenario, StreamId id) const {
    return RandomStream(derive_seed(seed_, scenario, id));
}

} // namespace retirecalc
