#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <random>

namespace ULIDLite {

    // 80 bits of randomness, big endian
    using Entropy = std::array<uint8_t, 10>;

    /**
     * Supplies the random part of new identifiers.
     * Implementations are not required to be cryptographically secure.
     */
    class RandomSource {
    public:
        virtual ~RandomSource() = default;

        // Same seed gives the same sequence from Next().
        virtual void Seed(uint64_t seed) = 0;
        virtual void SeedFromClock() = 0;
        virtual Entropy Next() = 0;
    };

    /**
     * std::mt19937_64 backed source. Seeds itself from the clock on first use
     * when neither Seed() nor SeedFromClock() has been called.
     */
    class MersenneSource : public RandomSource {
        std::mt19937_64 gen;
        std::uniform_int_distribution<uint64_t> dis;
        bool seeded = false;

    public:
        MersenneSource() : dis(0, UINT64_MAX) {}
        explicit MersenneSource(uint64_t seed) : dis(0, UINT64_MAX) { Seed(seed); }

        void Seed(uint64_t seed) override;
        void SeedFromClock() override;
        Entropy Next() override;
        bool IsSeeded() const { return seeded; }
    };

    std::unique_ptr<RandomSource> MakeDefaultRandomSource();

}  // namespace ULIDLite
