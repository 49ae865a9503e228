#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Cryptographically secure random number generation.
 *
 * Channel ids minted by the broker and executor session ids must be unpredictable,
 * so every random value in relayhub is drawn from libsodium's CSPRNG.
 * libsodium is initialized lazily on first use (sodium_init() is idempotent and
 * thread-safe); no libsodium types appear in this interface.
 *
 * @see https://libsodium.gitbook.io/doc/
 */
#include "relayhub_utils_export.h"

#include <cstddef>
#include <cstdint>

namespace relayhub::crypto
{

/**
 * @brief Ensures libsodium is initialized, calling sodium_init() if needed.
 * @return True if libsodium is usable, false on catastrophic failure.
 */
RELAYHUB_UTILS_EXPORT bool ensure_sodium_init() noexcept;

/**
 * @brief Fills @p out with @p len cryptographically secure random bytes.
 * @note Thread-safe and fork-safe.
 */
RELAYHUB_UTILS_EXPORT void generate_random_bytes(uint8_t *out, size_t len) noexcept;

/**
 * @brief Generates a random 64-bit unsigned integer.
 */
RELAYHUB_UTILS_EXPORT uint64_t generate_random_u64() noexcept;

/**
 * @brief Returns a uniformly distributed value in [0, upper_bound).
 * @details Wraps randombytes_uniform(), which avoids modulo bias.
 * @return 0 when @p upper_bound is below 2.
 */
RELAYHUB_UTILS_EXPORT uint32_t random_uniform(uint32_t upper_bound) noexcept;

} // namespace relayhub::crypto
