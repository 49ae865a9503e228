#include "utils/relay_broker.hpp"

#include "channel_registry.hpp"

#include "utils/logger.hpp"
#include "utils/relay_protocol.hpp"
#include "utils/uid_utils.hpp"

#include <zmq.hpp>
#include <zmq_addon.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <array>
#include <atomic>
#include <chrono>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace relayhub::broker
{

namespace
{
// Z85 keypair buffer: 40 printable chars + null terminator
constexpr size_t kZ85KeyBufSize = 41;
// Z85 key length (no null terminator)
constexpr size_t kZ85KeyLen = 40;
// Broker poll timeout (kept short so peer timeouts are checked promptly)
constexpr std::chrono::milliseconds kPollTimeout{50};
// Upper bound on messages handled per poll cycle before timeouts are re-checked.
constexpr int kMaxMessagesPerCycle = 256;
// Time the context may spend flushing CLOSE frames on shutdown.
constexpr int kShutdownLingerMs = 200;
// Mint attempts before giving up on a collision-free channel id.
constexpr int kMaxMintAttempts = 16;

/// Short printable form of a ROUTER identity for log lines.
std::string identity_hex(const std::string& identity)
{
    std::string out;
    out.reserve(identity.size() * 2);
    for (unsigned char c : identity)
    {
        fmt::format_to(std::back_inserter(out), "{:02x}", c);
    }
    return out;
}

enum class SendStatus
{
    Ok,
    WouldBlock,  ///< Recipient's pipe is full; the frame was dropped for that recipient.
    Unreachable, ///< Identity no longer routable (peer vanished).
};
} // namespace

// ============================================================================
// RelayBrokerImpl: all private state and logic
// ============================================================================

/// Connection state of a peer that completed HELLO.
struct PeerEntry
{
    protocol::Role role{protocol::Role::Caller};
    std::string    channel;
    std::string    session_id;
    std::chrono::steady_clock::time_point last_seen{std::chrono::steady_clock::now()};
};

class RelayBrokerImpl
{
public:
    RelayBroker::Config cfg;
    std::string         server_public_z85;
    std::string         server_secret_z85;
    ChannelRegistry     registry;
    std::unordered_map<std::string, PeerEntry> peers;
    std::atomic<bool>   stop_requested{false};
    std::string         bound_url;

    /// Guards registry/peers/bound_url reads from external threads.
    /// The run() thread holds this lock during post-poll processing (not during poll).
    mutable std::mutex  m_query_mu;

    void run();

    void process_frames(zmq::socket_t& socket, std::vector<zmq::message_t>& frames);
    void process_control(zmq::socket_t&        socket,
                         const std::string&    identity,
                         const std::string&    msg_type,
                         const nlohmann::json& body);
    void process_data(zmq::socket_t& socket, const std::string& identity,
                      const zmq::message_t& payload);

    void handle_hello(zmq::socket_t& socket, const std::string& identity,
                      const nlohmann::json& body);
    void join_executor(zmq::socket_t& socket, const std::string& identity,
                       std::string channel, const std::string& session_id);
    void join_caller(zmq::socket_t& socket, const std::string& identity,
                     const std::string& channel);

    /// Bookkeeping for a departed peer (clean close, BYE, timeout or unreachable).
    void teardown_peer(zmq::socket_t& socket, const std::string& identity, const char* reason);

    void broadcast_to_callers(zmq::socket_t& socket, const std::string& channel,
                              const nlohmann::json& envelope);
    void check_peer_timeouts(zmq::socket_t& socket);
    void close_all_peers(zmq::socket_t& socket);

    std::string mint_channel_id() const;

    static SendStatus send_control(zmq::socket_t&        socket,
                                   const std::string&    identity,
                                   const std::string&    msg_type,
                                   const nlohmann::json& body);
    static SendStatus send_data(zmq::socket_t& socket, const std::string& identity,
                                const zmq::message_t& payload);
    static void send_close(zmq::socket_t& socket, const std::string& identity, int code,
                           const std::string& reason);
};

// ============================================================================
// RelayBrokerImpl::run(): main event loop
// ============================================================================

void RelayBrokerImpl::run()
{
    zmq::context_t ctx(1);
    zmq::socket_t router(ctx, zmq::socket_type::router);
    // Sends to a vanished identity fail with EHOSTUNREACH instead of being dropped.
    router.set(zmq::sockopt::router_mandatory, 1);
    router.set(zmq::sockopt::linger, kShutdownLingerMs);

    if (cfg.use_curve)
    {
        router.set(zmq::sockopt::curve_server, 1);
        router.set(zmq::sockopt::curve_secretkey, server_secret_z85);
        router.set(zmq::sockopt::curve_publickey, server_public_z85);
    }

    if (protocol::is_ipv6_host(cfg.host))
    {
        router.set(zmq::sockopt::ipv6, 1);
    }
    const std::string bind_host = protocol::bracket_host(cfg.host);
    const std::string bind_endpoint =
        cfg.port == 0 ? fmt::format("tcp://{}:*", bind_host)
                      : fmt::format("tcp://{}:{}", bind_host, cfg.port);
    try
    {
        router.bind(bind_endpoint);
    }
    catch (const zmq::error_t& e)
    {
        if (e.num() == EADDRINUSE)
        {
            throw std::runtime_error(fmt::format("Relay port {} is already in use", cfg.port));
        }
        throw std::runtime_error(
            fmt::format("Relay failed to bind {}: {}", bind_endpoint, e.what()));
    }

    const std::string bound = router.get(zmq::sockopt::last_endpoint);
    uint16_t bound_port = cfg.port;
    if (const auto colon = bound.rfind(':'); colon != std::string::npos)
    {
        bound_port = static_cast<uint16_t>(std::stoi(bound.substr(colon + 1)));
    }
    {
        std::lock_guard<std::mutex> lock(m_query_mu);
        bound_url = protocol::format_relay_url(cfg.host, bound_port, cfg.path);
    }
    if (cfg.on_ready)
    {
        cfg.on_ready(bound, server_public_z85);
    }
    LOGGER_INFO("Broker: listening on {} (mount path '{}')", bound, cfg.path);
    if (cfg.use_curve)
    {
        LOGGER_INFO("Broker: server_public_key = {}", server_public_z85);
    }

    while (!stop_requested.load(std::memory_order_acquire))
    {
        // --- Poll phase (no mutex: zmq_poll blocks up to kPollTimeout) ---
        std::vector<zmq::pollitem_t> items = {{router.handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, kPollTimeout);

        // --- Post-poll phase (mutex held: all registry reads/writes are protected) ---
        std::lock_guard<std::mutex> lock(m_query_mu);

        check_peer_timeouts(router);

        if ((items[0].revents & ZMQ_POLLIN) == 0)
        {
            continue;
        }

        for (int i = 0; i < kMaxMessagesPerCycle; ++i)
        {
            std::vector<zmq::message_t> frames;
            if (!zmq::recv_multipart(router, std::back_inserter(frames),
                                     zmq::recv_flags::dontwait))
            {
                break;
            }
            process_frames(router, frames);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_query_mu);
        close_all_peers(router);
    }
    router.close();
    LOGGER_INFO("Broker: stopped.");
}

// ============================================================================
// Message dispatch
// ============================================================================

void RelayBrokerImpl::process_frames(zmq::socket_t& socket, std::vector<zmq::message_t>& frames)
{
    // Expected layouts: [identity, 'C', msg_type, json] or [identity, 'A', payload]
    if (frames.size() < 3 || frames[1].size() != 1)
    {
        LOGGER_WARN("Broker: malformed message ({} frames)", frames.size());
        return;
    }
    const std::string identity = frames[0].to_string();
    const char frame_type = *static_cast<const char*>(frames[1].data());

    if (frame_type == protocol::kFrameTypeData)
    {
        process_data(socket, identity, frames[2]);
        return;
    }
    if (frame_type != protocol::kFrameTypeControl || frames.size() < 4)
    {
        LOGGER_WARN("Broker: malformed frame from {} (type byte 0x{:02x}, {} frames)",
                    identity_hex(identity), static_cast<unsigned char>(frame_type),
                    frames.size());
        return;
    }

    try
    {
        const std::string msg_type = frames[2].to_string();
        const nlohmann::json body = nlohmann::json::parse(frames[3].to_string());
        process_control(socket, identity, msg_type, body);
    }
    catch (const nlohmann::json::exception& e)
    {
        LOGGER_WARN("Broker: malformed JSON from {}: {}", identity_hex(identity), e.what());
    }
}

void RelayBrokerImpl::process_control(zmq::socket_t&        socket,
                                      const std::string&    identity,
                                      const std::string&    msg_type,
                                      const nlohmann::json& body)
{
    if (msg_type == protocol::msg::kHello)
    {
        handle_hello(socket, identity, body);
        return;
    }

    auto peer = peers.find(identity);
    if (msg_type == protocol::msg::kPing)
    {
        if (peer == peers.end())
        {
            send_close(socket, identity, protocol::close_code::kNotJoined,
                       "Connection has not joined a channel");
            return;
        }
        peer->second.last_seen = std::chrono::steady_clock::now();
        if (send_control(socket, identity, protocol::msg::kPong, nlohmann::json::object()) ==
            SendStatus::Unreachable)
        {
            teardown_peer(socket, identity, "unreachable");
        }
    }
    else if (msg_type == protocol::msg::kBye)
    {
        teardown_peer(socket, identity, "closed");
    }
    else
    {
        LOGGER_WARN("Broker: unknown control type '{}' from {}", msg_type,
                    identity_hex(identity));
    }
}

void RelayBrokerImpl::process_data(zmq::socket_t& socket, const std::string& identity,
                                   const zmq::message_t& payload)
{
    auto peer_it = peers.find(identity);
    if (peer_it == peers.end())
    {
        LOGGER_WARN("Broker: data from {} before HELLO; closing", identity_hex(identity));
        send_close(socket, identity, protocol::close_code::kNotJoined,
                   "Connection has not joined a channel");
        return;
    }
    PeerEntry& peer = peer_it->second;
    peer.last_seen = std::chrono::steady_clock::now();
    const std::string channel = peer.channel;

    const ChannelEntry* entry = registry.find_channel(channel);
    if (entry == nullptr)
    {
        LOGGER_ERROR("Broker: peer {} references missing channel '{}'", identity_hex(identity),
                     channel);
        return;
    }

    if (peer.role == protocol::Role::Executor)
    {
        // Executor → every caller currently in the channel. Absent callers miss it.
        std::vector<std::string> unreachable;
        for (const auto& caller : entry->callers)
        {
            const SendStatus st = send_data(socket, caller, payload);
            if (st == SendStatus::Unreachable)
            {
                unreachable.push_back(caller);
            }
            else if (st == SendStatus::WouldBlock)
            {
                LOGGER_WARN("Broker: caller {} on '{}' is backpressured; frame dropped",
                            identity_hex(caller), channel);
            }
        }
        for (const auto& caller : unreachable)
        {
            teardown_peer(socket, caller, "unreachable");
        }
        return;
    }

    // Caller → the channel's executor.
    std::string failure;
    if (!entry->has_executor())
    {
        failure = protocol::kExecutorNotConnectedError;
    }
    else
    {
        const std::string executor = entry->executor_identity;
        const SendStatus st = send_data(socket, executor, payload);
        if (st == SendStatus::WouldBlock)
        {
            failure = "Executor not writable";
        }
        else if (st == SendStatus::Unreachable)
        {
            teardown_peer(socket, executor, "unreachable");
            failure = protocol::kExecutorNotConnectedError;
        }
    }

    if (!failure.empty())
    {
        LOGGER_DEBUG("Broker: cannot forward from caller {} on '{}': {}", identity_hex(identity),
                     channel, failure);
        nlohmann::json env = protocol::make_control_envelope(protocol::event::kError, channel);
        env["error"] = failure;
        if (send_control(socket, identity, protocol::msg::kSystem, env) == SendStatus::Unreachable)
        {
            teardown_peer(socket, identity, "unreachable");
        }
    }
}

// ============================================================================
// Admission
// ============================================================================

void RelayBrokerImpl::handle_hello(zmq::socket_t& socket, const std::string& identity,
                                   const nlohmann::json& body)
{
    if (peers.count(identity) != 0)
    {
        // A repeated HELLO re-joins: drop the previous membership first.
        teardown_peer(socket, identity, "rejoin");
    }

    // Only the mount path is canonical; the declared path must match it byte for byte.
    const std::string path = body.value("path", std::string{"/"});
    if (path != cfg.path)
    {
        LOGGER_WARN("Broker: rejecting {}: path '{}' != '{}'", identity_hex(identity), path,
                    cfg.path);
        send_close(socket, identity, protocol::close_code::kInvalidPath,
                   "Invalid relay path. Expected: " + cfg.path);
        return;
    }

    const std::string type = body.value("type", std::string{});
    const auto role = protocol::role_from_str(type);
    if (!role.has_value())
    {
        LOGGER_WARN("Broker: rejecting {}: invalid connection type '{}'", identity_hex(identity),
                    type);
        send_close(socket, identity, protocol::close_code::kInvalidType,
                   "Invalid connection type: " + type);
        return;
    }

    std::string channel = body.value("channel", std::string{});
    if (*role == protocol::Role::Executor)
    {
        join_executor(socket, identity, std::move(channel), body.value("sessionId", std::string{}));
    }
    else
    {
        if (channel.empty())
        {
            LOGGER_WARN("Broker: rejecting caller {}: no channel id", identity_hex(identity));
            send_close(socket, identity, protocol::close_code::kChannelRequired,
                       "Channel ID required");
            return;
        }
        join_caller(socket, identity, channel);
    }
}

void RelayBrokerImpl::join_executor(zmq::socket_t& socket, const std::string& identity,
                                    std::string channel, const std::string& session_id)
{
    if (channel.empty())
    {
        channel = mint_channel_id();
        if (channel.empty())
        {
            LOGGER_ERROR("Broker: could not mint a free channel id");
            send_close(socket, identity, 1011, "Could not allocate a channel id");
            return;
        }
    }

    const std::string previous = registry.install_executor(channel, identity, session_id);
    if (!previous.empty())
    {
        // The replaced executor is dropped from the peer table before anything else is
        // sent, so its late close can never clear the new executor's slot.
        LOGGER_INFO("Broker: executor {} replaces {} on '{}'", identity_hex(identity),
                    identity_hex(previous), channel);
        peers.erase(previous);
        send_close(socket, previous, protocol::close_code::kReplaced,
                   "Replaced by a newer executor connection");
    }

    PeerEntry peer;
    peer.role       = protocol::Role::Executor;
    peer.channel    = channel;
    peer.session_id = session_id;
    peers[identity] = std::move(peer);

    LOGGER_INFO("Broker: executor {} joined channel '{}'", identity_hex(identity), channel);

    nlohmann::json welcome = protocol::make_control_envelope(protocol::event::kConnected, channel);
    if (!session_id.empty())
    {
        welcome["sessionId"] = session_id;
    }
    if (send_control(socket, identity, protocol::msg::kSystem, welcome) == SendStatus::Unreachable)
    {
        teardown_peer(socket, identity, "unreachable");
        return;
    }

    nlohmann::json notice =
        protocol::make_control_envelope(protocol::event::kExecutorConnected, channel);
    if (!session_id.empty())
    {
        notice["sessionId"] = session_id;
    }
    broadcast_to_callers(socket, channel, notice);
}

void RelayBrokerImpl::join_caller(zmq::socket_t& socket, const std::string& identity,
                                  const std::string& channel)
{
    registry.add_caller(channel, identity);

    PeerEntry peer;
    peer.role    = protocol::Role::Caller;
    peer.channel = channel;
    peers[identity] = std::move(peer);

    const ChannelEntry* entry = registry.find_channel(channel);
    const bool present = entry != nullptr && entry->has_executor();

    LOGGER_INFO("Broker: caller {} joined channel '{}' (executor {})", identity_hex(identity),
                channel, present ? "present" : "absent");

    nlohmann::json welcome = protocol::make_control_envelope(protocol::event::kConnected, channel);
    welcome["figmaExecutorPresent"] = present;
    if (present && !entry->executor_session_id.empty())
    {
        welcome["sessionId"] = entry->executor_session_id;
    }
    if (send_control(socket, identity, protocol::msg::kSystem, welcome) == SendStatus::Unreachable)
    {
        teardown_peer(socket, identity, "unreachable");
    }
}

// ============================================================================
// Teardown
// ============================================================================

void RelayBrokerImpl::teardown_peer(zmq::socket_t& socket, const std::string& identity,
                                    const char* reason)
{
    auto pos = peers.find(identity);
    if (pos == peers.end())
    {
        return;
    }
    const PeerEntry peer = std::move(pos->second);
    peers.erase(pos);

    if (peer.role == protocol::Role::Executor)
    {
        // clear_executor() refuses when another executor holds the slot.
        if (registry.clear_executor(peer.channel, identity))
        {
            LOGGER_INFO("Broker: executor {} left channel '{}' ({})", identity_hex(identity),
                        peer.channel, reason);
            nlohmann::json notice =
                protocol::make_control_envelope(protocol::event::kExecutorDisconnected, peer.channel);
            if (!peer.session_id.empty())
            {
                notice["sessionId"] = peer.session_id;
            }
            broadcast_to_callers(socket, peer.channel, notice);
        }
    }
    else
    {
        registry.remove_caller(peer.channel, identity);
        LOGGER_INFO("Broker: caller {} left channel '{}' ({})", identity_hex(identity),
                    peer.channel, reason);
    }

    if (registry.cleanup_if_empty(peer.channel))
    {
        LOGGER_INFO("Broker: channel '{}' is empty; removed", peer.channel);
    }
}

void RelayBrokerImpl::broadcast_to_callers(zmq::socket_t&        socket,
                                           const std::string&    channel,
                                           const nlohmann::json& envelope)
{
    const ChannelEntry* entry = registry.find_channel(channel);
    if (entry == nullptr)
    {
        return;
    }
    std::vector<std::string> unreachable;
    for (const auto& caller : entry->callers)
    {
        if (send_control(socket, caller, protocol::msg::kSystem, envelope) ==
            SendStatus::Unreachable)
        {
            unreachable.push_back(caller);
        }
    }
    for (const auto& caller : unreachable)
    {
        teardown_peer(socket, caller, "unreachable");
    }
}

// ============================================================================
// Peer liveness
// ============================================================================

void RelayBrokerImpl::check_peer_timeouts(zmq::socket_t& socket)
{
    if (cfg.peer_timeout.count() <= 0)
    {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::string> timed_out;
    for (const auto& [identity, peer] : peers)
    {
        if (now - peer.last_seen > cfg.peer_timeout)
        {
            timed_out.push_back(identity);
        }
    }
    for (const auto& identity : timed_out)
    {
        LOGGER_WARN("Broker: peer {} silent for more than {}ms; dropping", identity_hex(identity),
                    cfg.peer_timeout.count());
        send_close(socket, identity, protocol::close_code::kPeerTimeout, "Peer heartbeat timeout");
        teardown_peer(socket, identity, "timeout");
    }
}

void RelayBrokerImpl::close_all_peers(zmq::socket_t& socket)
{
    for (const auto& [identity, peer] : peers)
    {
        send_close(socket, identity, protocol::close_code::kGoingAway, "Relay shutting down");
    }
    LOGGER_INFO("Broker: closed {} peer(s), dropped {} channel(s)", peers.size(),
                registry.size());
    peers.clear();
    registry.clear();
}

std::string RelayBrokerImpl::mint_channel_id() const
{
    try
    {
        for (int attempt = 0; attempt < kMaxMintAttempts; ++attempt)
        {
            std::string id = uid::generate_channel_id();
            if (!registry.has_channel(id))
            {
                return id;
            }
        }
    }
    catch (const std::runtime_error& e)
    {
        LOGGER_ERROR("Broker: cannot mint a channel id: {}", e.what());
    }
    return {};
}

// ============================================================================
// Socket helpers
// ============================================================================

SendStatus RelayBrokerImpl::send_control(zmq::socket_t&        socket,
                                         const std::string&    identity,
                                         const std::string&    msg_type,
                                         const nlohmann::json& body)
{
    // Layout: [identity, 'C', msg_type, json_body]
    const std::string body_str = body.dump();
    std::array<zmq::const_buffer, 4> msgs = {zmq::buffer(identity),
                                             zmq::buffer(&protocol::kFrameTypeControl, 1),
                                             zmq::buffer(msg_type), zmq::buffer(body_str)};
    try
    {
        return zmq::send_multipart(socket, msgs, zmq::send_flags::dontwait).has_value()
                   ? SendStatus::Ok
                   : SendStatus::WouldBlock;
    }
    catch (const zmq::error_t& e)
    {
        if (e.num() != EHOSTUNREACH)
        {
            LOGGER_WARN("Broker: send to {} failed: {}", identity_hex(identity), e.what());
        }
        return SendStatus::Unreachable;
    }
}

SendStatus RelayBrokerImpl::send_data(zmq::socket_t& socket, const std::string& identity,
                                      const zmq::message_t& payload)
{
    // Layout: [identity, 'A', payload], payload bytes untouched.
    std::array<zmq::const_buffer, 3> msgs = {zmq::buffer(identity),
                                             zmq::buffer(&protocol::kFrameTypeData, 1),
                                             zmq::buffer(payload.data(), payload.size())};
    try
    {
        return zmq::send_multipart(socket, msgs, zmq::send_flags::dontwait).has_value()
                   ? SendStatus::Ok
                   : SendStatus::WouldBlock;
    }
    catch (const zmq::error_t& e)
    {
        if (e.num() != EHOSTUNREACH)
        {
            LOGGER_WARN("Broker: send to {} failed: {}", identity_hex(identity), e.what());
        }
        return SendStatus::Unreachable;
    }
}

void RelayBrokerImpl::send_close(zmq::socket_t& socket, const std::string& identity, int code,
                                 const std::string& reason)
{
    nlohmann::json body;
    body["code"]   = code;
    body["reason"] = reason;
    // Best effort: the peer may already be gone.
    static_cast<void>(send_control(socket, identity, protocol::msg::kClose, body));
}

// ============================================================================
// RelayBroker: Pimpl delegation
// ============================================================================

RelayBroker::RelayBroker(Config cfg) : pImpl(std::make_unique<RelayBrokerImpl>())
{
    pImpl->cfg = std::move(cfg);
    pImpl->cfg.path = protocol::normalize_path(pImpl->cfg.path);
    if (pImpl->cfg.use_curve)
    {
        std::array<char, kZ85KeyBufSize> pub{};
        std::array<char, kZ85KeyBufSize> sec{};
        if (zmq_curve_keypair(pub.data(), sec.data()) != 0)
        {
            throw std::runtime_error("RelayBroker: zmq_curve_keypair failed");
        }
        pImpl->server_public_z85.assign(pub.data(), kZ85KeyLen);
        pImpl->server_secret_z85.assign(sec.data(), kZ85KeyLen);
    }
}

RelayBroker::~RelayBroker() = default;

const std::string& RelayBroker::server_public_key() const
{
    return pImpl->server_public_z85;
}

void RelayBroker::run()
{
    pImpl->run();
}

void RelayBroker::stop()
{
    pImpl->stop_requested.store(true, std::memory_order_release);
}

std::string RelayBroker::relay_url() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_query_mu);
    return pImpl->bound_url;
}

std::string RelayBroker::list_channels_json_str() const
{
    nlohmann::json result = nlohmann::json::array();
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(pImpl->m_query_mu);
    for (const auto& [name, entry] : pImpl->registry.all_channels())
    {
        result.push_back(nlohmann::json{
            {"channel",         name},
            {"executorPresent", entry.has_executor()},
            {"callerCount",     static_cast<int>(entry.callers.size())},
            {"ageSeconds",      std::chrono::duration_cast<std::chrono::seconds>(
                                    now - entry.created_at).count()}
        });
    }
    return result.dump();
}

size_t RelayBroker::channel_count() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_query_mu);
    return pImpl->registry.size();
}

} // namespace relayhub::broker
