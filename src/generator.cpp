#include "generator.hpp"
#include "logging.hpp"

namespace ULIDLite {

const char *OverflowPolicyName(OverflowPolicy policy) noexcept {
    switch (policy) {
        case OverflowPolicy::AdvanceTimestamp: return "advance";
        case OverflowPolicy::Fail: return "fail";
    }
    return "??";
}

ULIDGenerator::ULIDGenerator(std::unique_ptr<RandomSource> src, Clock clk, OverflowPolicy policy)
  : source(std::move(src)),
    clock(std::move(clk)),
    overflowPolicy(policy) {
    if (!source) source = MakeDefaultRandomSource();
    if (!clock) clock = SystemNowMs;
}

ErrorCode ULIDGenerator::generate(ULID &out) {
    uint64_t now = clock();
    if (now > maxTimestamp_ms) return ErrorCode::TimestampOverflow;

    uint64_t ts = now;
    if (hasLast) {
        uint64_t lastTs = last.timestamp();
        if (now < lastClock_ms) {
            LOG_WARN("clock moved backwards by {} ms, holding timestamp at {}", lastClock_ms - now, lastTs);
        }

        // clamp: never go below the last timestamp
        if (now <= lastTs) {
            ULID next;
            if (last.successor(next) == ErrorCode::OK) {
                last = next;
                lastClock_ms = now;
                out = last;
                return ErrorCode::OK;
            }
            if (overflowPolicy == OverflowPolicy::Fail) {
                LOG_WARN("randomness exhausted within millisecond {}", lastTs);
                return ErrorCode::RandomnessOverflow;
            }
            if (lastTs == maxTimestamp_ms) return ErrorCode::TimestampOverflow;
            LOG_DEBUG("randomness exhausted within millisecond {}, moving to {}", lastTs, lastTs + 1);
            ts = lastTs + 1;
        }
    }

    last = ULID::Pack(ts, source->Next());
    lastClock_ms = now;
    hasLast = true;
    out = last;
    return ErrorCode::OK;
}

ULID ULIDGenerator::Next() {
    ULID result;
    auto rc = generate(result);
    switch (rc) {
        case ErrorCode::OK: break;
        case ErrorCode::RandomnessOverflow:
            throw ULIDException(rc, fmt::format("no randomness left in millisecond {}", last.timestamp()));
        case ErrorCode::TimestampOverflow:
            throw ULIDException(rc, fmt::format("timestamp would exceed {}", maxTimestamp_ms));
        default:
            throw ULIDException(rc, "cannot generate");
    }
    return result;
}

ErrorCode ULIDGenerator::TryNext(ULID &out) noexcept {
    try {
        return generate(out);
    } catch (const ULIDException &e) {
        return e.code();
    } catch (const std::exception &e) {
        LOG_ERROR("generator failed: {}", e.what());
        return ErrorCode::Internal;
    }
}

ULIDGenerator NewGenerator(std::optional<uint64_t> seed, OverflowPolicy policy) {
    ULIDGenerator g(MakeDefaultRandomSource(), SystemNowMs, policy);
    if (seed)
        g.Seed(*seed);
    else
        g.SeedFromClock();
    return g;
}

}  // namespace ULIDLite
