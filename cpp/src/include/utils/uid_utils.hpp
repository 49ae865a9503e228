#pragma once
/**
 * @file uid_utils.hpp
 * @brief Generators and validators for relay identifiers.
 *
 * ## Formats
 *
 *   Channel id:  8 characters from [A-Z0-9]          e.g. "Q7K2M9XA"
 *   Session id:  16 lowercase hex digits (64 bits)   e.g. "3a7f2b1c9e1d4c2a"
 *   Request id:  "req-" + 32 lowercase hex digits    e.g. "req-9e1d...4c2a"
 *
 * Every random component comes from libsodium (see crypto_utils.hpp), so minted
 * channel ids cannot be guessed by a peer that knows earlier ones. The generators
 * throw std::runtime_error when libsodium cannot be initialized rather than hand
 * out ids built from zero-filled bytes.
 */

#include "utils/crypto_utils.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace relayhub::uid
{

/// Length of a broker-minted channel id.
inline constexpr std::size_t kChannelIdLength = 8;

namespace detail
{
inline constexpr std::string_view kChannelAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

inline void require_csprng(const char *what)
{
    if (!crypto::ensure_sodium_init())
    {
        throw std::runtime_error(fmt::format("{}: libsodium CSPRNG unavailable", what));
    }
}
} // namespace detail

/**
 * @brief Mint a fresh channel id: 8 uppercase alphanumeric characters.
 * @throws std::runtime_error if libsodium is unusable.
 */
inline std::string generate_channel_id()
{
    detail::require_csprng("generate_channel_id");
    std::string out;
    out.reserve(kChannelIdLength);
    for (std::size_t i = 0; i < kChannelIdLength; ++i)
    {
        const auto idx = crypto::random_uniform(static_cast<uint32_t>(detail::kChannelAlphabet.size()));
        out += detail::kChannelAlphabet[idx];
    }
    return out;
}

/**
 * @brief Generate an executor session id (64 random bits, hex).
 */
inline std::string generate_session_id()
{
    detail::require_csprng("generate_session_id");
    return fmt::format("{:016x}", crypto::generate_random_u64());
}

/**
 * @brief Generate a globally unique correlation id for an outgoing request.
 * @throws std::runtime_error if libsodium is unusable.
 */
inline std::string generate_request_id()
{
    detail::require_csprng("generate_request_id");
    return fmt::format("req-{:016x}{:016x}", crypto::generate_random_u64(),
                       crypto::generate_random_u64());
}

/// True if @p id has the shape of a broker-minted channel id.
inline bool is_minted_channel_id(std::string_view id) noexcept
{
    if (id.size() != kChannelIdLength)
    {
        return false;
    }
    for (char c : id)
    {
        if (detail::kChannelAlphabet.find(c) == std::string_view::npos)
        {
            return false;
        }
    }
    return true;
}

} // namespace relayhub::uid
