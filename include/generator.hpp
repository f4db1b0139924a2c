#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include "randomsource.hpp"
#include "timefunctions.h"
#include "ulid.hpp"
#include "ulidexception.h"

namespace ULIDLite {

    // What Next() does when the randomness of the current millisecond is exhausted.
    enum class OverflowPolicy {
        AdvanceTimestamp,  // continue in the next millisecond with fresh randomness (default)
        Fail               // report RandomnessOverflow and leave the state untouched
    };

    const char *OverflowPolicyName(OverflowPolicy policy) noexcept;

    // milliseconds since the Unix epoch
    using Clock = std::function<uint64_t()>;

    /**
     * Monotonic ULID generator
     *
     * Within one instance every value is strictly greater than the previous one:
     * - a new millisecond gets fresh randomness from the RandomSource
     * - the same millisecond gets the previous randomness + 1
     * - a clock that moves backwards is held at the last timestamp
     *
     * Not thread safe. Use one instance per thread or guard it with a mutex.
     */
    class ULIDGenerator {
        std::unique_ptr<RandomSource> source;
        Clock clock;
        OverflowPolicy overflowPolicy;
        ULID last;
        bool hasLast = false;
        uint64_t lastClock_ms = 0;

        ErrorCode generate(ULID &out);

    public:
        explicit ULIDGenerator(std::unique_ptr<RandomSource> src = MakeDefaultRandomSource(), Clock clk = SystemNowMs, OverflowPolicy policy = OverflowPolicy::AdvanceTimestamp);
        ULIDGenerator(ULIDGenerator &&) = default;
        ULIDGenerator &operator=(ULIDGenerator &&) = default;
        ULIDGenerator(const ULIDGenerator &) = delete;
        ULIDGenerator &operator=(const ULIDGenerator &) = delete;

        /**
         * @brief Produce the next identifier.
         * @throws ULIDException TimestampOverflow when the clock (or the advanced
         *         timestamp) is past 2^48 - 1, RandomnessOverflow under OverflowPolicy::Fail.
         */
        ULID Next();

        // Non-throwing Next(); out is only written on ErrorCode::OK.
        ErrorCode TryNext(ULID &out) noexcept;

        void Seed(uint64_t seed) { source->Seed(seed); }
        void SeedFromClock() { source->SeedFromClock(); }

        void SetClock(Clock clk) { clock = std::move(clk); }
        void SetOverflowPolicy(OverflowPolicy policy) { overflowPolicy = policy; }
        OverflowPolicy GetOverflowPolicy() const { return overflowPolicy; }

        bool HasLast() const { return hasLast; }
        const ULID &Last() const { return last; }
        RandomSource &Source() { return *source; }
    };

    // Generator with the default source, seeded with seed or from the clock.
    ULIDGenerator NewGenerator(std::optional<uint64_t> seed = std::nullopt, OverflowPolicy policy = OverflowPolicy::AdvanceTimestamp);

}  // namespace ULIDLite
