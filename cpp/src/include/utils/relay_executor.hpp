#pragma once
/**
 * @file relay_executor.hpp
 * @brief Executor side of a relay channel: receives requests, writes responses.
 *
 * RelayExecutor is the transport half of an executor process. It joins a channel
 * as the executor (minting one when no id is given), hands every application
 * envelope `{id, type, payload}` to a handler, and writes `{id, result}` or
 * `{id, error}` back. What a request *means* is entirely the handler's business.
 *
 * Single-threaded: the owning thread drives all I/O through poll_once(). There is
 * no internal worker, so the handler runs on the polling thread.
 *
 * @code
 * RelayExecutor exec;
 * const std::string channel = exec.connect("tcp://127.0.0.1:8888");
 * exec.set_handler([](const std::string &type, const nlohmann::json &) {
 *     return type == "ping" ? nlohmann::json{{"pong", true}} : nlohmann::json();
 * });
 * while (exec.is_open()) exec.poll_once(std::chrono::milliseconds(100));
 * @endcode
 */
#include "relayhub_utils_export.h"

#include "utils/relay_error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace relayhub::client
{

class RelayExecutorImpl;

class RELAYHUB_UTILS_EXPORT RelayExecutor
{
  public:
    /// Receives (type, payload); the return value becomes `result`. A thrown
    /// std::exception becomes `error`.
    using Handler = std::function<nlohmann::json(const std::string &type,
                                                 const nlohmann::json &payload)>;

    struct Options
    {
        /// Add `sessionId` to every response envelope.
        bool tag_session{true};
        /// Declared in HELLO; generated when empty.
        std::string session_id;
        std::chrono::milliseconds ping_interval{std::chrono::seconds(20)};
        /// Broker CurveZMQ public key (Z85); empty for a plain socket.
        std::string server_key;
    };

    RelayExecutor();
    /// @throws std::runtime_error if a session id must be generated and libsodium is unusable.
    explicit RelayExecutor(Options options);
    ~RelayExecutor();

    RelayExecutor(const RelayExecutor &) = delete;
    RelayExecutor &operator=(const RelayExecutor &) = delete;

    /**
     * @brief Join @p relay_url as executor of @p channel (minted by the relay if empty).
     * @return The channel id announced by the relay.
     * @throws RelayError InvalidArgument for a malformed URL, Rejected when the relay
     *         closes the connection, RelayUnreachable on timeout.
     */
    std::string connect(const std::string &relay_url, const std::string &channel = {},
                        std::chrono::milliseconds timeout = std::chrono::seconds(5));

    void set_handler(Handler handler);

    /**
     * @brief Wait up to @p timeout for one inbound frame and process it.
     *        Also sends the periodic PING when due.
     * @return true if a frame was processed.
     */
    bool poll_once(std::chrono::milliseconds timeout);

    /**
     * @brief Write an arbitrary application envelope to the channel's callers.
     * @return false if the endpoint is closed or the write would block.
     */
    bool send_raw(const nlohmann::json &envelope);

    /// Sends BYE and closes the socket. Idempotent.
    void close();

    [[nodiscard]] bool is_open() const noexcept;
    [[nodiscard]] const std::string &channel_id() const noexcept;
    [[nodiscard]] const std::string &session_id() const noexcept;
    /// Code of the relay's CLOSE frame; 0 while open or after a local close().
    [[nodiscard]] int close_code() const noexcept;
    [[nodiscard]] const std::string &close_reason() const noexcept;
    /// Most recent control envelope from the relay (null before the first one).
    [[nodiscard]] const nlohmann::json &last_control_event() const noexcept;

  private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<RelayExecutorImpl> pImpl;
};

} // namespace relayhub::client
