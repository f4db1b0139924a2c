#include "ulid_c.h"
#include <cstring>
#include <new>
#include "logging.hpp"
#include "ulidlite.hpp"

using ULIDLite::ErrorCode;

struct ulid_ctx {
    ULIDLite::ULIDGenerator generator;
    explicit ulid_ctx(uint32_t seed) : generator(ULIDLite::NewGenerator(seed == 0 ? std::nullopt : std::optional<uint64_t>(seed))) {}
};

static int toReturnCode(ErrorCode rc) {
    switch (rc) {
        case ErrorCode::OK: return ULID_OK;
        case ErrorCode::InvalidLength: return ULID_ERR_INVALID_LENGTH;
        case ErrorCode::InvalidCharacter: return ULID_ERR_INVALID_CHARACTER;
        case ErrorCode::TimestampOverflow: return ULID_ERR_TIMESTAMP_OVERFLOW;
        case ErrorCode::RandomnessOverflow: return ULID_ERR_RANDOMNESS_OVERFLOW;
        case ErrorCode::BufferTooSmall: return ULID_ERR_BUFFER_TOO_SMALL;
        case ErrorCode::NullArgument: return ULID_ERR_NULL_ARGUMENT;
        case ErrorCode::Internal: return ULID_ERR_INTERNAL;
    }
    return ULID_ERR_INTERNAL;
}

static ErrorCode nextFrom(ulid_ctx *ctx, ULIDLite::ULID &out) {
    if (ctx) return ctx->generator.TryNext(out);
    return ULIDLite::TryGenerateDefault(out);
}

extern "C" {

ulid_ctx *ulid_init(uint32_t seed) {
    try {
        return new ulid_ctx(seed);
    } catch (const std::exception &e) {
        LOG_ERROR("ulid_init: {}", e.what());
        return nullptr;
    }
}

void ulid_free(ulid_ctx *ctx) {
    delete ctx;
}

void ulid_seed(ulid_ctx *ctx, uint32_t seed) {
    try {
        if (ctx) {
            if (seed == 0)
                ctx->generator.SeedFromClock();
            else
                ctx->generator.Seed(seed);
        } else {
            if (seed == 0)
                ULIDLite::SeedDefaultFromClock();
            else
                ULIDLite::SeedDefault(seed);
        }
    } catch (const std::exception &e) {
        LOG_ERROR("ulid_seed: {}", e.what());
    }
}

int ulid_new(ulid_ctx *ctx, ulid *dest) {
    if (!dest) return ULID_ERR_NULL_ARGUMENT;
    ULIDLite::ULID id;
    auto rc = nextFrom(ctx, id);
    if (rc != ErrorCode::OK) {
        LOG_DEBUG("ulid_new: {}", ULIDLite::ErrorCodeName(rc));
        return toReturnCode(rc);
    }
    std::memcpy(*dest, id.data(), ULID_BINARY_LEN);
    return ULID_OK;
}

int ulid_write_new(ulid_ctx *ctx, char *dest, size_t size) {
    if (!dest) return ULID_ERR_NULL_ARGUMENT;
    if (size < ULID_LEN + 1) return ULID_ERR_BUFFER_TOO_SMALL;
    ULIDLite::ULID id;
    auto rc = nextFrom(ctx, id);
    if (rc != ErrorCode::OK) return toReturnCode(rc);
    ULIDLite::Base32::EncodeTo(id.binary(), dest);
    dest[ULID_LEN] = '\0';
    return ULID_LEN;
}

int ulid_write_raw(const ulid *id, char *dest, size_t size) {
    if (!id || !dest) return ULID_ERR_NULL_ARGUMENT;
    if (size < ULID_LEN) return ULID_ERR_BUFFER_TOO_SMALL;
    ULIDLite::ULID value(*id);
    ULIDLite::Base32::EncodeTo(value.binary(), dest);
    return ULID_LEN;
}

int ulid_write(const ulid *id, char *dest, size_t size) {
    if (!id || !dest) return ULID_ERR_NULL_ARGUMENT;
    if (size < ULID_LEN + 1) return ULID_ERR_BUFFER_TOO_SMALL;
    int rc = ulid_write_raw(id, dest, size);
    if (rc < 0) return rc;
    dest[ULID_LEN] = '\0';
    return rc;
}

int ulid_parse(const char *src, size_t len, ulid *dest) {
    if (!src || !dest) return ULID_ERR_NULL_ARGUMENT;
    ULIDLite::ULIDBytes bytes;
    auto rc = ULIDLite::Base32::Decode(std::string_view(src, len), bytes);
    if (rc != ErrorCode::OK) return toReturnCode(rc);
    std::memcpy(*dest, bytes.data(), ULID_BINARY_LEN);
    return ULID_OK;
}

uint64_t ulid_timestamp(const ulid *id) {
    if (!id) return 0;
    return ULIDLite::ULID(*id).timestamp();
}

const char *ulid_strerror(int rc) {
    switch (rc) {
        case ULID_OK: return "success";
        case ULID_ERR_BUFFER_TOO_SMALL: return "destination buffer too small";
        case ULID_ERR_INVALID_LENGTH: return "input is not 26 characters";
        case ULID_ERR_INVALID_CHARACTER: return "character outside the Crockford Base32 alphabet";
        case ULID_ERR_TIMESTAMP_OVERFLOW: return "timestamp exceeds 48 bits";
        case ULID_ERR_RANDOMNESS_OVERFLOW: return "randomness exhausted within the millisecond";
        case ULID_ERR_NULL_ARGUMENT: return "null argument";
        case ULID_ERR_INTERNAL: return "internal error";
    }
    return rc > 0 ? "success" : "unknown error";
}

}
