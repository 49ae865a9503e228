#pragma once
/**
 * @file relay_protocol.hpp
 * @brief Wire vocabulary shared by the relay broker, the caller session and the executor.
 *
 * ## Framing (ZeroMQ multipart, broker side prepends the ROUTER identity)
 *
 *   Control:  ['C', msg_type, json_body]
 *   Data:     ['A', payload_bytes]          application envelope, forwarded verbatim
 *
 * Peer → broker control types:  HELLO, PING, BYE
 * Broker → peer control types:  SYSTEM (control envelope), PONG, CLOSE {code, reason}
 *
 * ## Relay URL
 *
 *   tcp://host:port[/path][?type=executor|caller&channel=ID]
 *
 * The endpoint part is what the DEALER connects to; the path must match the
 * broker's mount path; `type` and `channel` are declared in the HELLO body.
 */
#include "relayhub_utils_export.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace relayhub::protocol
{

// Universal framing: Frame 0 type byte.
inline constexpr char kFrameTypeControl = 'C';
inline constexpr char kFrameTypeData = 'A';

namespace msg
{
inline constexpr const char *kHello = "HELLO";
inline constexpr const char *kPing = "PING";
inline constexpr const char *kPong = "PONG";
inline constexpr const char *kBye = "BYE";
inline constexpr const char *kSystem = "SYSTEM";
inline constexpr const char *kClose = "CLOSE";
} // namespace msg

/// Events carried by `{kind:"system"}` control envelopes.
namespace event
{
inline constexpr const char *kConnected = "connected";
inline constexpr const char *kExecutorConnected = "executor_connected";
inline constexpr const char *kExecutorDisconnected = "executor_disconnected";
inline constexpr const char *kError = "error";
} // namespace event

/// Close codes sent in CLOSE frames. 1xxx mirror the usual socket close codes.
namespace close_code
{
inline constexpr int kNormal = 1000;
inline constexpr int kGoingAway = 1001;       ///< Broker shutting down.
inline constexpr int kChannelRequired = 4000; ///< Caller joined without a channel id.
inline constexpr int kReplaced = 4001;        ///< Superseded by a newer executor.
inline constexpr int kNotJoined = 4002;       ///< Traffic from a peer that never sent HELLO.
inline constexpr int kInvalidType = 4003;     ///< Unknown connection role.
inline constexpr int kInvalidPath = 4004;     ///< Path does not match the mount path.
inline constexpr int kPeerTimeout = 4008;     ///< No traffic within the peer timeout.
} // namespace close_code

/// Message sent with executor-absent routing errors.
inline constexpr const char *kExecutorNotConnectedError = "Executor not connected";

enum class Role
{
    Executor,
    Caller,
};

[[nodiscard]] constexpr const char *role_to_str(Role r) noexcept
{
    return r == Role::Executor ? "executor" : "caller";
}

/**
 * @brief Parses a declared connection role.
 *
 * Accepts "executor" and "caller", and the legacy aliases "figma" (executor) and
 * "client" (caller). An empty string is a caller.
 * @return std::nullopt for any other value.
 */
[[nodiscard]] RELAYHUB_UTILS_EXPORT std::optional<Role> role_from_str(std::string_view s) noexcept;

/**
 * @brief Canonical form of a mount path: leading '/', no single trailing '/'.
 *        "" and "/" both become "/".
 */
[[nodiscard]] RELAYHUB_UTILS_EXPORT std::string normalize_path(std::string_view path);

/// True when @p host is an IPv6 literal such as "::1" (given without brackets).
[[nodiscard]] RELAYHUB_UTILS_EXPORT bool is_ipv6_host(std::string_view host) noexcept;

/// "[host]" for an IPv6 literal, @p host unchanged otherwise.
[[nodiscard]] RELAYHUB_UTILS_EXPORT std::string bracket_host(std::string_view host);

struct RelayUrl
{
    std::string endpoint; ///< "tcp://host:port", what a DEALER connects to.
    std::string host;     ///< IPv6 literals are stored without brackets.
    uint16_t port{0};
    std::string path{"/"}; ///< Normalized.
    std::optional<std::string> type;
    std::optional<std::string> channel;
};

/**
 * @brief Parses "tcp://host:port[/path][?query]".
 *
 * An IPv6 host must be bracketed, as in "tcp://[::1]:8888".
 * @throws std::invalid_argument on a missing scheme, host, or a port outside 1..65535.
 */
[[nodiscard]] RELAYHUB_UTILS_EXPORT RelayUrl parse_relay_url(std::string_view url);

/// Builds "tcp://host:port/path" (path normalized, IPv6 host bracketed).
[[nodiscard]] RELAYHUB_UTILS_EXPORT std::string format_relay_url(const std::string &host,
                                                                 uint16_t port,
                                                                 std::string_view path);

/// `{kind:"system", event, channel}`; callers add the optional fields.
[[nodiscard]] RELAYHUB_UTILS_EXPORT nlohmann::json make_control_envelope(std::string_view event,
                                                                         const std::string &channel);

/// True if @p j is an object with `kind == "system"`.
[[nodiscard]] RELAYHUB_UTILS_EXPORT bool is_control_envelope(const nlohmann::json &j) noexcept;

/// Value of the envelope's "sessionId" string field, or "" when absent.
[[nodiscard]] RELAYHUB_UTILS_EXPORT std::string session_tag(const nlohmann::json &j);

} // namespace relayhub::protocol
