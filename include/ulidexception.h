#pragma once

#include <stdexcept>
#include <string>

namespace ULIDLite {

    enum class ErrorCode : int {
        OK = 0,
        InvalidLength,       // decode input is not 26 characters
        InvalidCharacter,    // decode input has a character outside the alphabet
        TimestampOverflow,   // timestamp does not fit in 48 bits
        RandomnessOverflow,  // same-millisecond increment ran out of randomness
        BufferTooSmall,      // C surface only
        NullArgument,        // C surface only
        Internal
    };

    const char *ErrorCodeName(ErrorCode code) noexcept;

    class ULIDException : public std::runtime_error {
        ErrorCode rc;

    public:
        ULIDException(ErrorCode code, const std::string &message);
        ErrorCode code() const noexcept { return rc; }
    };

}  // namespace ULIDLite
