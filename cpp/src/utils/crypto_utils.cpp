/**
 * @file crypto_utils.cpp
 * @brief Implementation of random number utilities using libsodium.
 */
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"

#include <sodium.h>

#include <atomic>
#include <cstring>

namespace relayhub::crypto
{

namespace
{
// sodium_init() is idempotent; the flag only keeps the fast path lock-free.
std::atomic<bool> g_sodium_initialized{false};
} // namespace

bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    // Returns 0 on first success, 1 if already initialized, -1 on failure.
    if (sodium_init() == -1)
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: sodium_init() failed!");
        return false;
    }

    g_sodium_initialized.store(true, std::memory_order_release);
    LOGGER_DEBUG("[CryptoUtils] libsodium initialized");
    return true;
}

void generate_random_bytes(uint8_t *out, size_t len) noexcept
{
    if (out == nullptr)
    {
        LOGGER_ERROR("[CryptoUtils] generate_random_bytes: null output pointer");
        return;
    }

    if (!ensure_sodium_init())
    {
        LOGGER_ERROR(
            "[CryptoUtils] FATAL: Cannot generate random bytes, libsodium not initialized!");
        std::memset(out, 0, len);
        return;
    }

    // randombytes_buf never fails (libsodium aborts on catastrophic RNG failure)
    randombytes_buf(out, len);
}

uint64_t generate_random_u64() noexcept
{
    uint64_t value = 0;
    generate_random_bytes(reinterpret_cast<uint8_t *>(&value), sizeof(value));
    return value;
}

uint32_t random_uniform(uint32_t upper_bound) noexcept
{
    if (upper_bound < 2)
    {
        return 0;
    }
    if (!ensure_sodium_init())
    {
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

} // namespace relayhub::crypto
