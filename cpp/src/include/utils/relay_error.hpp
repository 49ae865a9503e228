#pragma once
/**
 * @file relay_error.hpp
 * @brief Error type surfaced by the caller-side relay session.
 *
 * Every externally caused failure reaches the issuing thread as a RelayError
 * thrown from a std::future. The RelayErrc code lets callers branch without
 * parsing messages; the message itself carries the context (channel id, elapsed
 * time, pending count) needed to tell "not started", "not paired" and "timed out"
 * apart in a log line.
 */
#include "relayhub_utils_export.h"

#include <stdexcept>
#include <string>

namespace relayhub::client
{

enum class RelayErrc
{
    InvalidArgument,      ///< Malformed relay URL, empty id, non-object envelope.
    NotConnected,         ///< send() before connect() succeeded, or after disconnect.
    ExecutorNotConnected, ///< Joined, but the channel has no executor.
    RelayUnreachable,     ///< connect window elapsed without any answer from the broker.
    Rejected,             ///< Broker closed the connection at admission (close code set).
    RequestTimeout,       ///< No correlated response within the request timeout.
    TooManyPending,       ///< Admission ceiling on in-flight requests reached.
    Disconnected,         ///< Socket torn down (disconnect(), broker close, replacement).
    KeepaliveTimeout,     ///< No traffic from the broker within the keepalive deadline.
    ExecutorDisconnected, ///< The channel's executor left while requests were in flight.
    BrokerError,          ///< The broker reported a routing error for this channel.
    RemoteError,          ///< The executor answered with an error field.
    WriteFailed,          ///< The envelope could not be queued on the socket.
};

/// Stable name of @p code, e.g. "RequestTimeout".
[[nodiscard]] RELAYHUB_UTILS_EXPORT const char *to_string(RelayErrc code) noexcept;

/**
 * @brief Coarse classification for tool-call issuers.
 * @return One of "E_NOT_CONNECTED", "E_TIMEOUT", "E_REMOTE", "E_INVALID_INPUT",
 *         "E_INTERNAL".
 * @note TooManyPending is reported as "E_TIMEOUT": the caller may retry once
 *       in-flight requests settle.
 */
[[nodiscard]] RELAYHUB_UTILS_EXPORT const char *error_code_string(RelayErrc code) noexcept;

class RELAYHUB_UTILS_EXPORT RelayError : public std::runtime_error
{
  public:
    RelayError(RelayErrc code, const std::string &message)
        : std::runtime_error(message), m_code(code), m_close_code(0)
    {
    }

    RelayError(RelayErrc code, const std::string &message, int close_code)
        : std::runtime_error(message), m_code(code), m_close_code(close_code)
    {
    }

    [[nodiscard]] RelayErrc code() const noexcept { return m_code; }

    /// Broker close code for Rejected / Disconnected errors; 0 otherwise.
    [[nodiscard]] int close_code() const noexcept { return m_close_code; }

  private:
    RelayErrc m_code;
    int m_close_code;
};

} // namespace relayhub::client
