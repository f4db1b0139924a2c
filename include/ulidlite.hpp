#pragma once

#include <optional>
#include <string>
#include <string_view>
#include "base32.hpp"
#include "config.hpp"
#include "generator.hpp"
#include "randomsource.hpp"
#include "ulid.hpp"
#include "ulidexception.h"

#define ULIDLITE_VERSION "0.3.0"

namespace ULIDLite {

    inline std::string Encode(const ULID &id) { return id.toString(); }

    // @throws ULIDException InvalidLength, InvalidCharacter, TimestampOverflow
    inline ULID Decode(std::string_view text) { return ULID(text); }

    inline ErrorCode TryDecode(std::string_view text, ULID &out) noexcept {
        ULIDBytes bytes;
        auto rc = Base32::Decode(text, bytes);
        if (rc == ErrorCode::OK) out = ULID(bytes);
        return rc;
    }

    /**
     * Process-wide default generator.
     * Built from Config::FromEnvironment() on first use, guarded by a mutex,
     * never destroyed before process exit.
     */
    std::string GenerateDefault();
    ULID GenerateDefaultULID();
    ErrorCode TryGenerateDefault(ULID &out) noexcept;
    void SeedDefault(uint64_t seed);
    void SeedDefaultFromClock();

}  // namespace ULIDLite
