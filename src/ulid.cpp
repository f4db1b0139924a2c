#include "ulid.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace ULIDLite {

const ULID ULID::empty {};

/**
 * Build a ULID from its two fields
 * @param timestamp_ms Milliseconds since epoch, at most 2^48 - 1
 * @param randomness 80 random bits
 * @throws ULIDException TimestampOverflow
 */
ULID ULID::Pack(uint64_t timestamp_ms, const Entropy &randomness) {
    if (timestamp_ms > maxTimestamp_ms)
        throw ULIDException(ErrorCode::TimestampOverflow, fmt::format("timestamp {} exceeds {}", timestamp_ms, maxTimestamp_ms));

    Bytes ulid_bytes {};

    // Timestamp (48 bits = 6 bytes) - big endian
    uint64_t ts = timestamp_ms;
    for (int i = TIMESTAMP_LENGTH - 1; i >= 0; --i) {
        ulid_bytes[i] = static_cast<uint8_t>(ts & 0xFF);
        ts >>= 8;
    }
    std::copy(randomness.begin(), randomness.end(), ulid_bytes.begin() + TIMESTAMP_LENGTH);
    return ULID(ulid_bytes);
}

ULID ULID::fromBinary(std::string_view binary) {
    if (binary.length() != LENGTH)
        throw ULIDException(ErrorCode::InvalidLength, fmt::format("Binary string length not equal to {}, submitted {}", LENGTH, binary.length()));
    return ULID(reinterpret_cast<const uint8_t *>(binary.data()));
}

/**
 * Extract timestamp from ULID
 * @return Timestamp in milliseconds since epoch
 */
uint64_t ULID::timestamp() const {
    uint64_t ts = 0;
    for (size_t i = 0; i < TIMESTAMP_LENGTH; ++i) {
        ts = (ts << 8) | binary_data[i];
    }
    return ts;
}

Entropy ULID::randomness() const {
    Entropy r;
    std::copy(binary_data.begin() + TIMESTAMP_LENGTH, binary_data.end(), r.begin());
    return r;
}

ErrorCode ULID::successor(ULID &next) const noexcept {
    Bytes b = binary_data;
    for (size_t i = LENGTH - 1; i >= TIMESTAMP_LENGTH; --i) {
        if (++b[i] != 0) {
            next = ULID(b);
            return ErrorCode::OK;
        }
    }
    // carried out of the randomness field
    return ErrorCode::RandomnessOverflow;
}

/**
 * Convert to hexadecimal string for debugging
 * @return 32-character hex string
 */
std::string ULID::toHex(bool uppercase) const {
    static const char hexLower[] = "0123456789abcdef";
    static const char hexUpper[] = "0123456789ABCDEF";
    const char *hex_chars = uppercase ? hexUpper : hexLower;

    std::string result;
    result.reserve(LENGTH * 2);
    for (uint8_t byte : binary_data) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

/**
 * Create ULID from hex string, either case
 * @param hex_string 32-character hex string
 */
ULID ULID::fromHex(std::string_view hex_string) {
    if (hex_string.length() != LENGTH * 2) {
        throw ULIDException(ErrorCode::InvalidLength, fmt::format("expected {} hex digits, got {}", LENGTH * 2, hex_string.length()));
    }
    auto hexval = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + c - 'a';
        if (c >= 'A' && c <= 'F') return 10 + c - 'A';
        return -1;
    };

    Bytes bytes;
    for (size_t i = 0; i < LENGTH; ++i) {
        int hi = hexval(hex_string[i * 2]);
        int lo = hexval(hex_string[i * 2 + 1]);
        if (hi < 0 || lo < 0) throw ULIDException(ErrorCode::InvalidCharacter, fmt::format("'{}' is not hexadecimal", hex_string));
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return ULID(bytes);
}

bool ULID::isValidString(std::string_view ulid_string) noexcept {
    Bytes ignored;
    return Base32::Decode(ulid_string, ignored) == ErrorCode::OK;
}

std::istream &operator>>(std::istream &is, ULID &ulid) {
    std::string str;
    if (!(is >> str)) return is;
    ULIDBytes bytes;
    if (Base32::Decode(str, bytes) == ErrorCode::OK)
        ulid = ULID(bytes);
    else
        is.setstate(std::ios::failbit);
    return is;
}

}  // namespace ULIDLite
