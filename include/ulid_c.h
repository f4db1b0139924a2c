#pragma once

/*
 * C interface for embedding from other languages.
 *
 * Nothing here throws and nothing allocates except ulid_init().
 * Functions return a non-negative value on success and a negative
 * ULID_ERR_* code on failure.
 */

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Number of bytes for the binary representation of a `ulid` (big endian) */
#define ULID_BINARY_LEN 16

/** Number of bytes for the ASCII text representation of a `ulid` */
#define ULID_LEN 26

#define ULID_OK 0
#define ULID_ERR_BUFFER_TOO_SMALL -1
#define ULID_ERR_INVALID_LENGTH -2
#define ULID_ERR_INVALID_CHARACTER -3
#define ULID_ERR_TIMESTAMP_OVERFLOW -4
#define ULID_ERR_RANDOMNESS_OVERFLOW -5
#define ULID_ERR_NULL_ARGUMENT -6
#define ULID_ERR_INTERNAL -7

/** Generator context; owns the random number generator and the monotonic state */
typedef struct ulid_ctx ulid_ctx;

typedef uint8_t ulid[ULID_BINARY_LEN];

/**
 * Create a generator context. Passing 0 as `seed` seeds it from the clock.
 * Returns NULL when memory cannot be allocated. Release with ulid_free().
 */
ulid_ctx *ulid_init(uint32_t seed);

void ulid_free(ulid_ctx *ctx);

/** Re-seed `ctx`, or the process-wide default generator when `ctx` is NULL. 0 seeds from the clock. */
void ulid_seed(ulid_ctx *ctx, uint32_t seed);

/**
 * Create a new 128-bit ULID in `dest`.
 * A NULL `ctx` uses the process-wide default generator.
 * Returns ULID_OK or a negative error code.
 */
int ulid_new(ulid_ctx *ctx, ulid *dest);

/**
 * Write a new ULID to `dest` as a NUL terminated string of ULID_LEN characters.
 * `size` must be at least ULID_LEN + 1.
 * Returns ULID_LEN on success or a negative error code.
 */
int ulid_write_new(ulid_ctx *ctx, char *dest, size_t size);

/**
 * Write `id` to `dest` as a NUL terminated string (ULID_LEN + 1 bytes).
 * Returns ULID_LEN on success or a negative error code.
 */
int ulid_write(const ulid *id, char *dest, size_t size);

/** Same as ulid_write() without the terminator; `size` must be at least ULID_LEN. */
int ulid_write_raw(const ulid *id, char *dest, size_t size);

/** Parse `len` characters at `src` into `dest`. Either case is accepted. */
int ulid_parse(const char *src, size_t len, ulid *dest);

/** Timestamp field of `id` in milliseconds since the Unix epoch. */
uint64_t ulid_timestamp(const ulid *id);

/** Static description of an error code. */
const char *ulid_strerror(int rc);

#ifdef __cplusplus
}
#endif
