#pragma once

#include <chrono>
#include <cstdint>

using TimePoint = std::chrono::system_clock::time_point;

namespace ULIDLite {

    constexpr uint64_t maxTimestamp_ms {(uint64_t(1) << 48) - 1};  // 10889-08-02 05:31:50.655 UTC

    inline int64_t ChronoToEPOCH_ms(const TimePoint &t) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

    inline TimePoint EPOCH_msToChrono(int64_t t) {
        std::chrono::system_clock::time_point tp {};  // zero
        tp += std::chrono::milliseconds(t);
        return tp;
    }

    // milliseconds since the Unix epoch from the system clock; 0 when the clock is set before 1970
    uint64_t SystemNowMs();

}  // namespace ULIDLite
