#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "generator.hpp"

namespace ULIDLite {

    /**
     * Settings for generators built by the library itself (the default instance, the CLI).
     *
     * Environment:
     *   ULIDLITE_SEED       unsigned integer, fixed seed for reproducible output
     *   ULIDLITE_OVERFLOW   "advance" or "fail"
     *   ULIDLITE_LOG_LEVEL  spdlog level name (trace, debug, info, warn, err, critical, off)
     */
    struct Config {
        std::optional<uint64_t> seed;
        OverflowPolicy overflowPolicy {OverflowPolicy::AdvanceTimestamp};
        std::string logLevel {"info"};

        using Lookup = std::function<const char *(const char *)>;

        static Config FromEnvironment();
        // Invalid values are logged and leave the default in place.
        static Config FromLookup(const Lookup &lookup);

        static std::optional<uint64_t> ParseSeed(const std::string &value);
        static std::optional<OverflowPolicy> ParseOverflowPolicy(const std::string &value);
    };

    ULIDGenerator MakeGenerator(const Config &config);

    // Whole-string unsigned decimal; surrounding blanks are ignored.
    std::optional<uint64_t> ParseUnsigned(const std::string &value);

}  // namespace ULIDLite
