#include "timefunctions.h"

uint64_t ULIDLite::SystemNowMs() {
    auto ms = ChronoToEPOCH_ms(std::chrono::system_clock::now());
    return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}
