#include "randomsource.hpp"
#include <chrono>

namespace ULIDLite {

void MersenneSource::Seed(uint64_t seed) {
    gen.seed(seed);
    dis.reset();
    seeded = true;
}

void MersenneSource::SeedFromClock() {
    // nanosecond resolution so two sources created in the same millisecond still differ
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch();
    Seed(static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count()));
}

Entropy MersenneSource::Next() {
    if (!seeded) SeedFromClock();

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);

    Entropy result;
    for (int i = 7; i >= 0; --i) {
        result[i] = static_cast<uint8_t>(hi & 0xFF);
        hi >>= 8;
    }
    result[8] = static_cast<uint8_t>((lo >> 8) & 0xFF);
    result[9] = static_cast<uint8_t>(lo & 0xFF);
    return result;
}

std::unique_ptr<RandomSource> MakeDefaultRandomSource() {
    return std::make_unique<MersenneSource>();
}

}  // namespace ULIDLite
