#pragma once
/**
 * @file relay_broker.hpp
 * @brief Channel broker: pairs one executor with any number of callers per channel.
 *
 * RelayBroker listens on a ZMQ ROUTER socket. Every peer (a DEALER) declares itself
 * with a HELLO carrying its mount path, role and channel id. The broker groups peers
 * into channels and forwards application payloads verbatim:
 *
 *   executor → every caller of the channel (broadcast, no queuing)
 *   caller   → the channel's executor, or a synthesized `error` control envelope
 *              back to the caller when no executor is attached or writable
 *
 * Admission:
 *   - path mismatch                  → CLOSE 4004
 *   - unknown role                   → CLOSE 4003
 *   - caller without channel id      → CLOSE 4000
 *   - executor without channel id    → a fresh [A-Z0-9]{8} id is minted
 *   - executor on an occupied channel → previous executor gets CLOSE 4001 first
 *
 * All socket I/O is single-threaded (run() loop); stop(), relay_url(),
 * list_channels_json_str() and channel_count() are thread-safe.
 */
#include "relayhub_utils_export.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relayhub::broker
{

class RelayBrokerImpl;

class RELAYHUB_UTILS_EXPORT RelayBroker
{
public:
    struct Config
    {
        std::string host{"127.0.0.1"};
        /// 0 binds an ephemeral port; the bound endpoint is reported via on_ready.
        uint16_t port{8888};
        /// Mount path peers must declare; normalized on construction.
        std::string path{"/"};

        /// A peer silent for longer than this is torn down as if it had closed.
        /// Zero disables the check.
        std::chrono::milliseconds peer_timeout{std::chrono::seconds(60)};

        /// Enable CurveZMQ; peers then need server_public_key().
        bool use_curve{false};

        /// Optional: called from run() after bind() with (bound_endpoint, server_public_key).
        /// Useful for tests using port 0.
        std::function<void(const std::string& bound_endpoint,
                           const std::string& pubkey)> on_ready;
    };

    /// @throws std::runtime_error if CurveZMQ keypair generation fails.
    explicit RelayBroker(Config cfg);
    ~RelayBroker();

    RelayBroker(const RelayBroker&) = delete;
    RelayBroker& operator=(const RelayBroker&) = delete;

    /**
     * @brief Server public key (Z85-encoded, 40 chars); empty unless use_curve.
     */
    [[nodiscard]] const std::string& server_public_key() const;

    /**
     * @brief Main event loop. Blocks until stop() is called.
     *
     * On exit every connected peer receives CLOSE 1001 and the channel table is cleared.
     * @throws std::runtime_error "Relay port N is already in use" when the bind fails
     *         with EADDRINUSE, or another bind error.
     */
    void run();

    /**
     * @brief Signal the run() loop to exit. Thread-safe.
     */
    void stop();

    /**
     * @brief "tcp://host:port[/path]" of the bound socket; empty before bind.
     */
    [[nodiscard]] std::string relay_url() const;

    /**
     * @brief Returns a JSON array describing every live channel.
     *
     * Each element has "channel", "executorPresent", "callerCount", "ageSeconds":
     * @code
     * [{"channel":"Q7K2M9XA","executorPresent":true,"callerCount":2,"ageSeconds":41}]
     * @endcode
     */
    [[nodiscard]] std::string list_channels_json_str() const;

    [[nodiscard]] size_t channel_count() const;

private:
#if defined(_MSC_VER)
#pragma warning(suppress : 4251)
#endif
    std::unique_ptr<RelayBrokerImpl> pImpl;
};

} // namespace relayhub::broker
