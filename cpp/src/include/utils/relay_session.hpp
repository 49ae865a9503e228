#pragma once
/**
 * @file relay_session.hpp
 * @brief Caller side of the relay: one broker connection bound to one channel.
 *
 * RelaySession hides the relay transport behind a request/response contract:
 *
 *   connect(url, channel) : join the channel as a caller; resolves once the channel
 *                            has an executor (already present, or announced within
 *                            connect_timeout).
 *   send / request         : write an application envelope, track it as a pending
 *                            request keyed by its correlation id, resolve with the
 *                            executor's `result` or reject with its `error`.
 *
 * An internal worker thread owns the DEALER socket, the pending-request table and
 * every timer (connect window, per-request deadline, keepalive). Public methods are
 * thread-safe and return std::future; failures surface as RelayError thrown from
 * future::get().
 *
 * The session never reconnects or retries on its own. A caller that wants to
 * survive a relay restart calls connect() again, typically with a binding restored
 * via load_connection_state().
 */
#include "relayhub_utils_export.h"

#include "utils/relay_error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relayhub::client
{

class RelaySessionImpl;

class RELAYHUB_UTILS_EXPORT RelaySession
{
  public:
    struct Options
    {
        /// Window in which connect() must observe an executor.
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(30)};
        /// Interval between keepalive PINGs while the socket is open.
        std::chrono::milliseconds ping_interval{std::chrono::seconds(20)};
        /// The socket is torn down when nothing arrives for this long.
        std::chrono::milliseconds keepalive_timeout{std::chrono::seconds(45)};
        /// Used by send()/request() when no explicit timeout is passed.
        std::chrono::milliseconds default_request_timeout{std::chrono::seconds(90)};
        /// Admission ceiling on in-flight requests.
        std::size_t max_pending{200};
        /// Broker CurveZMQ public key (Z85, 40 chars); empty for a plain socket.
        std::string server_key;
    };

    /// One entry of the diagnostic ring kept by debug_events().
    struct DebugEvent
    {
        std::chrono::system_clock::time_point ts;
        std::string event;
        std::string detail;
    };

    /// Number of entries debug_events() retains.
    static constexpr std::size_t kDebugEventCapacity = 80;

    RelaySession();
    explicit RelaySession(Options options);
    ~RelaySession();

    RelaySession(const RelaySession &) = delete;
    RelaySession &operator=(const RelaySession &) = delete;

    /**
     * @brief Join @p channel_id on the relay at @p relay_url as a caller.
     *
     * A channel id passed here overrides a `channel` query parameter in the URL.
     * Any previously open socket is closed first; its pending requests are rejected
     * with Disconnected.
     *
     * The future fails with:
     *   - InvalidArgument       malformed URL or no channel id
     *   - RelayUnreachable      no answer from the relay within connect_timeout
     *   - ExecutorNotConnected  joined, but no executor within connect_timeout
     *                           (the socket stays joined)
     *   - Rejected              the relay closed the connection (close_code() set)
     *   - BrokerError           the relay reported an error for the channel
     */
    [[nodiscard]] std::future<void> connect(const std::string &relay_url,
                                            const std::string &channel_id = {});

    /**
     * @brief Send an application envelope and wait for the correlated response.
     *
     * The envelope must be a JSON object. Its string `id` is used as the correlation
     * id; one is minted when absent. The future resolves with the response's
     * `result` (null when absent).
     *
     * Fails immediately with NotConnected / ExecutorNotConnected when the session is
     * not paired, and with TooManyPending at the admission ceiling. A correlation id
     * that cannot be minted (libsodium unusable) fails it with WriteFailed.
     */
    [[nodiscard]] std::future<nlohmann::json>
    send(nlohmann::json envelope,
         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Builds `{type, id, payload}` with a fresh correlation id and sends it.
     */
    [[nodiscard]] std::future<nlohmann::json>
    request(const std::string &type, nlohmann::json payload = nlohmann::json::object(),
            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Fire-and-forget write. No pending request is created; skipped when the
     *        session has no executor.
     */
    void send_notification(nlohmann::json envelope);

    /**
     * @brief Leave the channel and close the socket. Blocks until the worker has
     *        rejected every pending request with Disconnected.
     */
    void disconnect();

    /// True while the socket has joined a channel.
    [[nodiscard]] bool is_connected() const noexcept;
    /// True while the joined channel is known to have an executor.
    [[nodiscard]] bool is_executor_connected() const noexcept;
    /// Channel joined (or being joined); empty before the first connect().
    [[nodiscard]] std::string channel_id() const;
    [[nodiscard]] std::size_t pending_count() const noexcept;
    /// Snapshot of the correlation ids currently awaiting a response.
    [[nodiscard]] std::vector<std::string> pending_request_ids() const;
    /// Oldest first; at most kDebugEventCapacity entries.
    [[nodiscard]] std::vector<DebugEvent> debug_events() const;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<RelaySessionImpl> pImpl;
};

/// Persisted caller binding, so an issuing process can rejoin after a restart.
struct ConnectionState
{
    std::string relay_url;
    std::string channel_code;
    std::string saved_at; ///< ISO-8601 UTC; filled by save_connection_state().
};

/**
 * @brief Writes {relayUrl, channelCode, savedAt} to @p path (temp file + rename).
 * @return false if the file could not be written; the failure is logged.
 */
RELAYHUB_UTILS_EXPORT bool save_connection_state(const std::string &path,
                                                 const ConnectionState &state);

/**
 * @brief Reads a binding written by save_connection_state().
 * @return std::nullopt if the file is missing, unreadable, or lacks either field.
 */
[[nodiscard]] RELAYHUB_UTILS_EXPORT std::optional<ConnectionState>
load_connection_state(const std::string &path);

} // namespace relayhub::client
