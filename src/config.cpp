#include "config.hpp"
#include <boost/algorithm/string.hpp>
#include <charconv>
#include <cstdlib>
#include "logging.hpp"

namespace ULIDLite {

static std::string normalized(const char *raw) {
    return boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(std::string(raw)));
}

std::optional<uint64_t> ParseUnsigned(const std::string &value) {
    auto v = boost::algorithm::trim_copy(value);
    if (v.empty()) return std::nullopt;
    uint64_t number = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), number);
    if (ec != std::errc() || ptr != v.data() + v.size()) return std::nullopt;
    return number;
}

std::optional<uint64_t> Config::ParseSeed(const std::string &value) {
    return ParseUnsigned(value);
}

std::optional<OverflowPolicy> Config::ParseOverflowPolicy(const std::string &value) {
    auto v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
    if (v == "advance") return OverflowPolicy::AdvanceTimestamp;
    if (v == "fail") return OverflowPolicy::Fail;
    return std::nullopt;
}

Config Config::FromLookup(const Lookup &lookup) {
    Config config;

    if (const char *s = lookup("ULIDLITE_SEED")) {
        if (auto seed = ParseSeed(s))
            config.seed = seed;
        else
            LOG_WARN("ignoring ULIDLITE_SEED='{}': not an unsigned integer", s);
    }

    if (const char *s = lookup("ULIDLITE_OVERFLOW")) {
        if (auto policy = ParseOverflowPolicy(s))
            config.overflowPolicy = *policy;
        else
            LOG_WARN("ignoring ULIDLITE_OVERFLOW='{}': expected advance or fail", s);
    }

    if (const char *s = lookup("ULIDLITE_LOG_LEVEL")) {
        auto level = normalized(s);
        if (spdlog::level::from_str(level) != spdlog::level::off || level == "off")
            config.logLevel = level;
        else
            LOG_WARN("ignoring ULIDLITE_LOG_LEVEL='{}'", s);
    }
    return config;
}

Config Config::FromEnvironment() {
    return FromLookup([](const char *name) -> const char * { return std::getenv(name); });
}

ULIDGenerator MakeGenerator(const Config &config) {
    return NewGenerator(config.seed, config.overflowPolicy);
}

}  // namespace ULIDLite
