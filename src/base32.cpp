#include "base32.hpp"
#include <fmt/format.h>

namespace ULIDLite {

const int8_t Base32::DECODING[128] = {
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1,
    0, 1, 2, 3, 4, 5, 6, 7, 8, 9, -1, -1, -1, -1, -1, -1,
    -1, 10, 11, 12, 13, 14, 15, 16, 17, -1, 18, 19, -1, 20, 21, -1,
    22, 23, 24, 25, 26, -1, 27, 28, 29, 30, 31, -1, -1, -1, -1, -1,
    -1, 10, 11, 12, 13, 14, 15, 16, 17, -1, 18, 19, -1, 20, 21, -1,
    22, 23, 24, 25, 26, -1, 27, 28, 29, 30, 31, -1, -1, -1, -1, -1
};

void Base32::EncodeTo(const ULIDBytes &bytes, char *out) noexcept {
    // two zero bits of padding in front so the 130 bits split evenly into 26 groups
    uint32_t accumulator = 0;
    int bits_accumulated = 2;
    size_t pos = 0;

    for (uint8_t byte : bytes) {
        accumulator = (accumulator << 8) | byte;
        bits_accumulated += 8;

        while (bits_accumulated >= 5) {
            bits_accumulated -= 5;
            out[pos++] = ENCODING[(accumulator >> bits_accumulated) & 0x1F];
        }
    }
}

std::string Base32::Encode(const ULIDBytes &bytes) {
    std::string result(ENCODED_LENGTH, '0');
    EncodeTo(bytes, result.data());
    return result;
}

ErrorCode Base32::Decode(std::string_view text, ULIDBytes &out) noexcept {
    if (text.length() != ENCODED_LENGTH) return ErrorCode::InvalidLength;
    if (!IsValid(text)) return ErrorCode::InvalidCharacter;

    // the first character holds the top 3 bits; anything above '7' needs 130 bits
    int8_t first = Value(text[0]);
    if (first > 7) return ErrorCode::TimestampOverflow;

    ULIDBytes result {};
    uint32_t accumulator = static_cast<uint32_t>(first);
    int bits_accumulated = 3;
    size_t byte_index = 0;

    for (size_t i = 1; i < ENCODED_LENGTH; ++i) {
        accumulator = (accumulator << 5) | static_cast<uint32_t>(Value(text[i]));
        bits_accumulated += 5;

        if (bits_accumulated >= 8) {
            bits_accumulated -= 8;
            result[byte_index++] = static_cast<uint8_t>((accumulator >> bits_accumulated) & 0xFF);
        }
    }
    out = result;
    return ErrorCode::OK;
}

ULIDBytes Base32::Decode(std::string_view text) {
    ULIDBytes result {};
    auto rc = Decode(text, result);
    switch (rc) {
        case ErrorCode::OK: break;
        case ErrorCode::InvalidLength:
            throw ULIDException(rc, fmt::format("expected {} characters, got {}", ENCODED_LENGTH, text.length()));
        case ErrorCode::InvalidCharacter:
            throw ULIDException(rc, fmt::format("'{}' is not Crockford Base32", text));
        case ErrorCode::TimestampOverflow:
            throw ULIDException(rc, fmt::format("'{}' exceeds 128 bits", text));
        default:
            throw ULIDException(rc, fmt::format("cannot decode '{}'", text));
    }
    return result;
}

bool Base32::IsValid(std::string_view text) noexcept {
    if (text.length() != ENCODED_LENGTH) return false;
    for (char c : text) {
        if (Value(c) == -1) return false;
    }
    return true;
}

}  // namespace ULIDLite
