#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include "ulidexception.h"

namespace ULIDLite {

    using ULIDBytes = std::array<uint8_t, 16>;

    /**
     * Crockford Base32 codec for 128-bit identifiers.
     *
     * 128 bits are rendered as 26 characters of 5 bits each, most significant first.
     * 26 * 5 = 130, so the first character carries only the top 3 bits and is
     * always in the range '0'..'7' for a valid value.
     *
     * Encoding produces uppercase. Decoding accepts both cases and rejects
     * I, L, O, U like any other character outside the alphabet.
     */
    namespace Base32 {
        constexpr size_t ENCODED_LENGTH = 26;
        constexpr char ENCODING[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        extern const int8_t DECODING[128];

        std::string Encode(const ULIDBytes &bytes);
        // writes exactly ENCODED_LENGTH characters, no terminator
        void EncodeTo(const ULIDBytes &bytes, char *out) noexcept;

        ULIDBytes Decode(std::string_view text);
        ErrorCode Decode(std::string_view text, ULIDBytes &out) noexcept;

        bool IsValid(std::string_view text) noexcept;

        inline int8_t Value(char c) noexcept {
            auto u = static_cast<unsigned char>(c);
            return u < 128 ? DECODING[u] : int8_t(-1);
        }
    }

}  // namespace ULIDLite
