#include "ulidlite.hpp"
#include <mutex>
#include "logging.hpp"

namespace ULIDLite {

namespace {
    struct DefaultGenerator {
        std::mutex mtx;
        ULIDGenerator generator;

        explicit DefaultGenerator(const Config &config) : generator(MakeGenerator(config)) {
            LOG_DEBUG("default generator created, overflow policy {}", OverflowPolicyName(config.overflowPolicy));
        }
    };

    DefaultGenerator &Default() {
        // never destroyed; lives until process exit
        static DefaultGenerator *instance = new DefaultGenerator(Config::FromEnvironment());
        return *instance;
    }
}

ULID GenerateDefaultULID() {
    auto &d = Default();
    std::lock_guard<std::mutex> lock(d.mtx);
    return d.generator.Next();
}

std::string GenerateDefault() {
    return GenerateDefaultULID().toString();
}

ErrorCode TryGenerateDefault(ULID &out) noexcept {
    try {
        auto &d = Default();
        std::lock_guard<std::mutex> lock(d.mtx);
        return d.generator.TryNext(out);
    } catch (const std::exception &e) {
        LOG_ERROR("default generator unavailable: {}", e.what());
        return ErrorCode::Internal;
    }
}

void SeedDefault(uint64_t seed) {
    auto &d = Default();
    std::lock_guard<std::mutex> lock(d.mtx);
    d.generator.Seed(seed);
}

void SeedDefaultFromClock() {
    auto &d = Default();
    std::lock_guard<std::mutex> lock(d.mtx);
    d.generator.SeedFromClock();
}

}  // namespace ULIDLite

ULIDLite::ULID ULIDLite::ULID::generate() {
    return GenerateDefaultULID();
}
