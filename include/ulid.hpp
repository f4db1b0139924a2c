#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>
#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>
#include "base32.hpp"
#include "randomsource.hpp"
#include "timefunctions.h"
#include "ulidexception.h"

namespace ULIDLite {

    /**
     * ULID value with internal binary storage
     *
     * Layout (big endian, 16 bytes):
     * - bytes 0..5:  48-bit timestamp, milliseconds since Unix epoch
     * - bytes 6..15: 80-bit randomness
     *
     * Byte-wise comparison of the storage is the same as comparing the 128-bit
     * unsigned values, which is also the order of the encoded strings.
     *
     * Usage:
     *   ULID id = ULID::Pack(ts, entropy);      // From parts
     *   ULID id("01FJYWZ3RJM927XKDJGDR..");   // From string
     *   std::string str = id.toString();       // Convert to string
     *   auto binary = id.data();               // 16 raw bytes
     */
    class ULID {
    public:
        static constexpr size_t LENGTH = 16;
        static constexpr size_t ENCODED_LENGTH = Base32::ENCODED_LENGTH;
        static constexpr size_t TIMESTAMP_LENGTH = 6;
        using Bytes = ULIDBytes;

    private:
        Bytes binary_data {};

    public:
        ULID() = default;  // nil
        explicit ULID(std::string_view ulid_string) : binary_data(Base32::Decode(ulid_string)) {}
        explicit ULID(const Bytes &binary_ulid) : binary_data(binary_ulid) {}
        explicit ULID(const uint8_t *data) { std::memcpy(binary_data.data(), data, LENGTH); }
        ULID(const ULID &other) = default;
        ULID &operator=(const ULID &other) = default;

        static const ULID empty;

        static ULID Pack(uint64_t timestamp_ms, const Entropy &randomness);
        static ULID fromBinary(std::string_view binary);
        static ULID fromHex(std::string_view hex_string);
        static bool isValidString(std::string_view ulid_string) noexcept;
        static ULID generate();  // from the process-wide default generator

        std::string toString() const { return Base32::Encode(binary_data); }
        std::string toBinary() const { return std::string(reinterpret_cast<const char *>(data()), size()); }
        std::string toHex(bool uppercase = false) const;

        const uint8_t *data() const { return binary_data.data(); }
        const Bytes &binary() const { return binary_data; }
        constexpr size_t size() const { return LENGTH; }

        uint64_t timestamp() const;
        Entropy randomness() const;
        TimePoint timePoint() const { return EPOCH_msToChrono(static_cast<int64_t>(timestamp())); }

        // Same timestamp, randomness + 1. RandomnessOverflow when the randomness is all ones.
        ErrorCode successor(ULID &next) const noexcept;

        bool isNil() const { return binary_data == Bytes {}; }

        bool operator==(const ULID &other) const { return binary_data == other.binary_data; }
        bool operator!=(const ULID &other) const { return binary_data != other.binary_data; }
        bool operator<(const ULID &other) const { return binary_data < other.binary_data; }
        bool operator<=(const ULID &other) const { return binary_data <= other.binary_data; }
        bool operator>(const ULID &other) const { return binary_data > other.binary_data; }
        bool operator>=(const ULID &other) const { return binary_data >= other.binary_data; }
    };

    inline std::ostream &operator<<(std::ostream &os, const ULID &ulid) { return os << ulid.toString(); }
    std::istream &operator>>(std::istream &is, ULID &ulid);

}  // namespace ULIDLite

// Hash support for std::unordered_map, std::unordered_set
namespace std {
    template<> struct hash<ULIDLite::ULID> {
        size_t operator()(const ULIDLite::ULID &ulid) const {
            const auto &b = ulid.binary();
            return boost::hash_range(b.begin(), b.end());
        }
    };
}

template<> struct fmt::formatter<ULIDLite::ULID> : fmt::formatter<std::string_view> {
    template<typename FormatContext> auto format(const ULIDLite::ULID &ulid, FormatContext &ctx) const {
        char buf[ULIDLite::ULID::ENCODED_LENGTH];
        ULIDLite::Base32::EncodeTo(ulid.binary(), buf);
        return fmt::formatter<std::string_view>::format(std::string_view(buf, sizeof(buf)), ctx);
    }
};
