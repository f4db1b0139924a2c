#include "ulidexception.h"
#include <fmt/format.h>

const char *ULIDLite::ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidLength: return "InvalidLength";
        case ErrorCode::InvalidCharacter: return "InvalidCharacter";
        case ErrorCode::TimestampOverflow: return "TimestampOverflow";
        case ErrorCode::RandomnessOverflow: return "RandomnessOverflow";
        case ErrorCode::BufferTooSmall: return "BufferTooSmall";
        case ErrorCode::NullArgument: return "NullArgument";
        case ErrorCode::Internal: return "Internal";
    }
    return "??";
}

ULIDLite::ULIDException::ULIDException(ErrorCode code, const std::string &message)
  : std::runtime_error(fmt::format("{}: {}", ErrorCodeName(code), message)),
    rc(code) {}
