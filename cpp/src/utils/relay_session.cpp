#include "utils/relay_session.hpp"

#include "relay_frames.hpp"

#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/relay_protocol.hpp"
#include "utils/uid_utils.hpp"
#include "utils/zmq_context.hpp"

#include <zmq.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <variant>

namespace relayhub::client
{

// ============================================================================
// Constants and Helper Functions
// ============================================================================
namespace
{
using Clock = std::chrono::steady_clock;

/// How often the worker wakes while a socket is open, to poll it and check timers.
constexpr std::chrono::milliseconds kWorkerPollInterval{5};

/// "30s" for whole seconds, "50ms" otherwise.
std::string format_duration(std::chrono::milliseconds d)
{
    if (d.count() > 0 && d.count() % 1000 == 0)
    {
        return fmt::format("{}s", d.count() / 1000);
    }
    return fmt::format("{}ms", d.count());
}

std::exception_ptr make_error(RelayErrc code, const std::string &message, int close_code = 0)
{
    return std::make_exception_ptr(RelayError(code, message, close_code));
}

template <typename T> std::future<T> failed_future(RelayErrc code, const std::string &message)
{
    std::promise<T> promise;
    promise.set_exception(make_error(code, message));
    return promise.get_future();
}
} // namespace

// ============================================================================
// Async Queue Commands
// ============================================================================

struct ConnectCmd
{
    std::string url;
    std::string channel;
    std::promise<void> result;
};
struct SendCmd
{
    nlohmann::json envelope;
    std::string id;
    std::chrono::milliseconds timeout;
    std::promise<nlohmann::json> result;
};
struct NotifyCmd
{
    nlohmann::json envelope;
};
struct DisconnectCmd
{
    std::promise<void> result;
};
struct QueryPendingCmd
{
    std::promise<std::vector<std::string>> result;
};
struct StopCmd
{
};

using SessionCommand =
    std::variant<ConnectCmd, SendCmd, NotifyCmd, DisconnectCmd, QueryPendingCmd, StopCmd>;

// ============================================================================
// RelaySessionImpl
// ============================================================================

struct PendingRequest
{
    std::promise<nlohmann::json> result;
    Clock::time_point deadline;
    std::chrono::milliseconds timeout;
};

class RelaySessionImpl
{
  public:
    RelaySession::Options m_opts;

    // Worker thread state
    std::deque<SessionCommand> m_queue;
    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::thread m_worker;
    std::atomic<bool> m_running{false};

    // Read by any thread, written by the worker (m_pending_count also by send()).
    std::atomic<bool> m_joined{false};
    std::atomic<bool> m_executor_present{false};
    std::atomic<std::size_t> m_pending_count{0};

    // Guards m_channel and m_events.
    mutable std::mutex m_state_mu;
    std::string m_channel;
    std::deque<RelaySession::DebugEvent> m_events;

    // Worker-owned: never touched outside the worker thread.
    std::optional<zmq::socket_t> m_socket;
    std::string m_relay_url;
    std::string m_session_id;
    std::unordered_map<std::string, PendingRequest> m_pending;
    std::optional<std::promise<void>> m_connect_promise;
    Clock::time_point m_connect_deadline{};
    Clock::time_point m_next_ping{};
    Clock::time_point m_keepalive_deadline{};

    explicit RelaySessionImpl(RelaySession::Options opts) : m_opts(std::move(opts)) {}

    ~RelaySessionImpl()
    {
        if (m_running.load(std::memory_order_acquire))
        {
            enqueue(StopCmd{});
            if (m_worker.joinable())
            {
                m_worker.join();
            }
        }
    }

    RelaySessionImpl(const RelaySessionImpl &) = delete;
    RelaySessionImpl &operator=(const RelaySessionImpl &) = delete;

    void enqueue(SessionCommand cmd)
    {
        {
            std::lock_guard<std::mutex> lock(m_queue_mutex);
            m_queue.push_back(std::move(cmd));
        }
        m_queue_cv.notify_one();
    }

    void start_worker()
    {
        m_running.store(true, std::memory_order_release);
        m_worker = std::thread(&RelaySessionImpl::worker_loop, this);
    }

    [[nodiscard]] std::string channel() const
    {
        std::lock_guard<std::mutex> lock(m_state_mu);
        return m_channel;
    }

    void record(std::string event, std::string detail)
    {
        std::lock_guard<std::mutex> lock(m_state_mu);
        m_events.push_back(
            {std::chrono::system_clock::now(), std::move(event), std::move(detail)});
        if (m_events.size() > RelaySession::kDebugEventCapacity)
        {
            m_events.pop_front();
        }
    }

    void release_slot() noexcept { m_pending_count.fetch_sub(1, std::memory_order_acq_rel); }

    // ── Worker loop ──────────────────────────────────────────────────────────

    void worker_loop()
    {
        while (true)
        {
            std::deque<SessionCommand> batch;
            {
                std::unique_lock<std::mutex> lock(m_queue_mutex);
                if (m_socket.has_value())
                {
                    // Socket traffic does not notify the cv; cap the wait so it is
                    // polled and timers fire on schedule.
                    m_queue_cv.wait_for(lock, kWorkerPollInterval,
                                        [this] { return !m_queue.empty(); });
                }
                else
                {
                    m_queue_cv.wait(lock, [this] { return !m_queue.empty(); });
                }
                std::swap(batch, m_queue);
            }

            for (auto &cmd : batch)
            {
                const bool stop =
                    std::visit([&](auto &&variant_cmd) { return handle_command(variant_cmd); }, cmd);
                if (stop)
                {
                    m_running.store(false, std::memory_order_release);
                    return;
                }
            }

            if (m_socket.has_value())
            {
                process_incoming();
            }
            if (m_socket.has_value())
            {
                check_timers(Clock::now());
            }
        }
    }

    // ── Command handlers ─────────────────────────────────────────────────────
    // Each returns true if the worker should stop.

    bool handle_command(ConnectCmd &cmd)
    {
        if (m_socket.has_value())
        {
            close_socket(RelayErrc::Disconnected, "Connection replaced by a new connect()", 0,
                         true);
        }

        protocol::RelayUrl url;
        try
        {
            url = protocol::parse_relay_url(cmd.url);
        }
        catch (const std::invalid_argument &e)
        {
            cmd.result.set_exception(make_error(RelayErrc::InvalidArgument, e.what()));
            return false;
        }
        if (url.type.has_value() && protocol::role_from_str(*url.type) != protocol::Role::Caller)
        {
            cmd.result.set_exception(make_error(
                RelayErrc::InvalidArgument,
                fmt::format("RelaySession joins as a caller, not as '{}'", *url.type)));
            return false;
        }
        const std::string channel = !cmd.channel.empty() ? cmd.channel : url.channel.value_or("");
        if (channel.empty())
        {
            cmd.result.set_exception(
                make_error(RelayErrc::InvalidArgument, "Channel ID required to join a relay"));
            return false;
        }

        {
            std::lock_guard<std::mutex> lock(m_state_mu);
            m_channel = channel;
        }
        m_relay_url = cmd.url;
        m_session_id.clear();

        try
        {
            zmq::socket_t socket(get_zmq_context(), zmq::socket_type::dealer);
            socket.set(zmq::sockopt::linger, 0);
            if (protocol::is_ipv6_host(url.host))
            {
                socket.set(zmq::sockopt::ipv6, 1);
            }
            if (!m_opts.server_key.empty())
            {
                detail::apply_curve_client(socket, m_opts.server_key);
            }
            socket.connect(url.endpoint);

            nlohmann::json hello;
            hello["path"]    = url.path;
            hello["type"]    = protocol::role_to_str(protocol::Role::Caller);
            hello["channel"] = channel;
            if (!detail::send_control(socket, protocol::msg::kHello, hello))
            {
                cmd.result.set_exception(make_error(
                    RelayErrc::WriteFailed,
                    fmt::format("Could not queue HELLO to {} (channel {})", cmd.url, channel)));
                return false;
            }
            m_socket.emplace(std::move(socket));
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("RelaySession: cannot open socket to {}: {}", url.endpoint, e.what());
            cmd.result.set_exception(make_error(
                RelayErrc::RelayUnreachable,
                fmt::format("Cannot open a socket to {}: {}", url.endpoint, e.what())));
            return false;
        }
        catch (const std::runtime_error &e)
        {
            // apply_curve_client(): bad server key or keypair failure.
            cmd.result.set_exception(make_error(RelayErrc::InvalidArgument, e.what()));
            return false;
        }

        const auto now = Clock::now();
        m_connect_promise.emplace(std::move(cmd.result));
        m_connect_deadline   = now + m_opts.connect_timeout;
        m_keepalive_deadline = now + m_opts.keepalive_timeout;
        m_next_ping          = now + m_opts.ping_interval;

        LOGGER_INFO("RelaySession: joining channel '{}' at {}", channel, cmd.url);
        record("connecting", fmt::format("{} channel={}", cmd.url, channel));
        return false;
    }

    bool handle_command(SendCmd &cmd)
    {
        const std::string ch = channel();
        if (!m_socket.has_value() || !m_joined.load(std::memory_order_acquire))
        {
            release_slot();
            cmd.result.set_exception(
                make_error(RelayErrc::NotConnected,
                           fmt::format("Not connected to relay (channel '{}')", ch)));
            return false;
        }
        if (!m_executor_present.load(std::memory_order_acquire))
        {
            release_slot();
            cmd.result.set_exception(make_error(
                RelayErrc::ExecutorNotConnected,
                fmt::format("No executor connected to channel {}", ch)));
            return false;
        }
        if (m_pending.count(cmd.id) != 0)
        {
            release_slot();
            cmd.result.set_exception(make_error(
                RelayErrc::InvalidArgument,
                fmt::format("Request id '{}' is already pending", cmd.id)));
            return false;
        }

        bool written = false;
        try
        {
            written = detail::send_data(*m_socket, cmd.envelope.dump());
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_ERROR("RelaySession: write of '{}' failed: {}", cmd.id, e.what());
        }
        if (!written)
        {
            release_slot();
            cmd.result.set_exception(make_error(
                RelayErrc::WriteFailed,
                fmt::format("Failed to write request '{}' to channel {}", cmd.id, ch)));
            return false;
        }

        PendingRequest entry;
        entry.result   = std::move(cmd.result);
        entry.deadline = Clock::now() + cmd.timeout;
        entry.timeout  = cmd.timeout;
        m_pending.emplace(cmd.id, std::move(entry));
        LOGGER_TRACE("RelaySession: sent '{}' ({} pending)", cmd.id, m_pending.size());
        return false;
    }

    bool handle_command(NotifyCmd &cmd)
    {
        if (!m_socket.has_value() || !m_executor_present.load(std::memory_order_acquire))
        {
            record("notify_skipped", "no executor");
            return false;
        }
        try
        {
            if (!detail::send_data(*m_socket, cmd.envelope.dump()))
            {
                LOGGER_WARN("RelaySession: notification dropped (socket busy)");
            }
        }
        catch (const zmq::error_t &e)
        {
            LOGGER_WARN("RelaySession: notification write failed: {}", e.what());
        }
        return false;
    }

    bool handle_command(DisconnectCmd &cmd)
    {
        if (m_socket.has_value())
        {
            LOGGER_INFO("RelaySession: leaving channel '{}'", channel());
            close_socket(RelayErrc::Disconnected, "Session disconnected", 0, true);
        }
        cmd.result.set_value();
        return false;
    }

    bool handle_command(QueryPendingCmd &cmd)
    {
        std::vector<std::string> ids;
        ids.reserve(m_pending.size());
        for (const auto &[id, entry] : m_pending)
        {
            ids.push_back(id);
        }
        cmd.result.set_value(std::move(ids));
        return false;
    }

    bool handle_command(StopCmd & /*cmd*/)
    {
        close_socket(RelayErrc::Disconnected, "Session destroyed", 0, true);
        return true;
    }

    // ── Incoming traffic ─────────────────────────────────────────────────────

    void process_incoming()
    {
        while (m_socket.has_value())
        {
            std::optional<detail::Inbound> in;
            try
            {
                in = detail::recv_inbound(*m_socket);
            }
            catch (const zmq::error_t &e)
            {
                LOGGER_ERROR("RelaySession: receive failed: {}", e.what());
                close_socket(RelayErrc::Disconnected,
                             fmt::format("Socket error on channel {}: {}", channel(), e.what()));
                return;
            }
            if (!in.has_value())
            {
                return;
            }
            handle_inbound(*in);
        }
    }

    void handle_inbound(const detail::Inbound &in)
    {
        // Any traffic at all proves the relay is alive.
        m_keepalive_deadline = Clock::now() + m_opts.keepalive_timeout;

        if (in.kind == 0)
        {
            LOGGER_WARN("RelaySession: malformed frame from relay; dropped");
            return;
        }

        try
        {
            const nlohmann::json body = nlohmann::json::parse(in.body);
            if (in.kind == protocol::kFrameTypeData)
            {
                handle_application(body);
            }
            else if (in.msg_type == protocol::msg::kSystem)
            {
                handle_system(body);
            }
            else if (in.msg_type == protocol::msg::kClose)
            {
                handle_close(body.value("code", 0), body.value("reason", std::string{}));
            }
            else if (in.msg_type != protocol::msg::kPong)
            {
                LOGGER_WARN("RelaySession: unknown control type '{}'", in.msg_type);
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            // Malformed JSON or a field of the wrong type.
            LOGGER_WARN("RelaySession: invalid message from relay: {}", e.what());
        }
    }

    [[nodiscard]] bool is_stale(const std::string &tag) const
    {
        return !m_session_id.empty() && !tag.empty() && tag != m_session_id;
    }

    void handle_system(const nlohmann::json &env)
    {
        if (!protocol::is_control_envelope(env))
        {
            LOGGER_WARN("RelaySession: SYSTEM frame without a control envelope; dropped");
            return;
        }
        const std::string event = env.value("event", std::string{});
        const std::string tag   = protocol::session_tag(env);
        const std::string ch    = channel();

        if (event == protocol::event::kConnected)
        {
            const bool present = env.value("figmaExecutorPresent", false);
            {
                std::lock_guard<std::mutex> lock(m_state_mu);
                m_channel = env.value("channel", m_channel);
            }
            m_session_id = tag;
            m_joined.store(true, std::memory_order_release);
            m_executor_present.store(present, std::memory_order_release);
            LOGGER_INFO("RelaySession: joined channel '{}' (executor {})", ch,
                        present ? "present" : "absent");
            record("connected", fmt::format("channel={} executorPresent={}", ch, present));
            if (present)
            {
                settle_connect_ok();
            }
        }
        else if (event == protocol::event::kExecutorConnected)
        {
            // A new executor defines the session id from here on.
            m_session_id = tag;
            m_executor_present.store(true, std::memory_order_release);
            LOGGER_INFO("RelaySession: executor joined channel '{}'", ch);
            record("executor_connected", tag);
            settle_connect_ok();
        }
        else if (event == protocol::event::kExecutorDisconnected)
        {
            if (is_stale(tag))
            {
                record("stale_drop", fmt::format("executor_disconnected session={}", tag));
                return;
            }
            m_executor_present.store(false, std::memory_order_release);
            LOGGER_WARN("RelaySession: executor left channel '{}' ({} pending)", ch,
                        m_pending.size());
            record("executor_disconnected", tag);
            reject_all_pending(RelayErrc::ExecutorDisconnected,
                               fmt::format("Executor disconnected from channel {}", ch));
        }
        else if (event == protocol::event::kError)
        {
            const std::string error = env.value("error", std::string{"unknown relay error"});
            if (error == protocol::kExecutorNotConnectedError)
            {
                m_executor_present.store(false, std::memory_order_release);
            }
            LOGGER_WARN("RelaySession: relay error on channel '{}': {}", ch, error);
            record("relay_error", error);
            const std::string message = fmt::format("Relay error on channel {}: {}", ch, error);
            reject_all_pending(RelayErrc::BrokerError, message);
            settle_connect_fail(RelayErrc::BrokerError, message);
        }
        else
        {
            LOGGER_WARN("RelaySession: unknown control event '{}'", event);
        }
    }

    void handle_application(const nlohmann::json &env)
    {
        if (!env.is_object())
        {
            LOGGER_WARN("RelaySession: non-object envelope from executor; dropped");
            return;
        }
        const std::string tag = protocol::session_tag(env);
        if (is_stale(tag))
        {
            record("stale_drop", fmt::format("session={} current={}", tag, m_session_id));
            LOGGER_DEBUG("RelaySession: dropped envelope from stale session {}", tag);
            return;
        }
        const auto id_it = env.find("id");
        if (id_it == env.end() || !id_it->is_string())
        {
            LOGGER_DEBUG("RelaySession: envelope without id; dropped");
            return;
        }
        const std::string id = id_it->get<std::string>();
        auto pos = m_pending.find(id);
        if (pos == m_pending.end())
        {
            // Late or duplicate answer.
            record("unmatched_response", id);
            return;
        }
        std::promise<nlohmann::json> result = std::move(pos->second.result);
        m_pending.erase(pos);
        release_slot();

        const auto err_it = env.find("error");
        if (err_it != env.end() && !err_it->is_null())
        {
            const std::string error = err_it->is_string() ? err_it->get<std::string>()
                                                          : err_it->dump();
            result.set_exception(make_error(RelayErrc::RemoteError, error));
            return;
        }
        const auto res_it = env.find("result");
        result.set_value(res_it != env.end() ? *res_it : nlohmann::json());
    }

    void handle_close(int code, const std::string &reason)
    {
        const std::string ch = channel();
        LOGGER_WARN("RelaySession: relay closed channel '{}' connection (code {}): {}", ch, code,
                    reason);
        record("closed", fmt::format("code={} reason={}", code, reason));
        settle_connect_fail(
            RelayErrc::Rejected,
            fmt::format("Relay rejected the connection to channel {} (code {}): {}", ch, code,
                        reason),
            code);
        close_socket(RelayErrc::Disconnected,
                     fmt::format("Relay closed the connection (code {}): {}", code, reason), code);
    }

    // ── Timers ───────────────────────────────────────────────────────────────

    void check_timers(Clock::time_point now)
    {
        const std::string ch = channel();

        if (m_connect_promise.has_value() && now >= m_connect_deadline)
        {
            const std::string window = format_duration(m_opts.connect_timeout);
            if (!m_joined.load(std::memory_order_acquire))
            {
                const std::string message =
                    fmt::format("Relay at {} did not answer within {} (channel {})", m_relay_url,
                                window, ch);
                settle_connect_fail(RelayErrc::RelayUnreachable, message);
                close_socket(RelayErrc::Disconnected, message);
                return;
            }
            // Joined: the socket stays so a later executor_connected still pairs it.
            settle_connect_fail(
                RelayErrc::ExecutorNotConnected,
                fmt::format("No executor joined channel {} within {}", ch, window));
        }

        std::vector<std::string> expired;
        for (const auto &[id, entry] : m_pending)
        {
            if (now >= entry.deadline)
            {
                expired.push_back(id);
            }
        }
        for (const auto &id : expired)
        {
            auto pos = m_pending.find(id);
            PendingRequest entry = std::move(pos->second);
            m_pending.erase(pos);
            release_slot();
            const std::string message =
                fmt::format("Request '{}' timed out after {} (channel {}, {} pending)", id,
                            format_duration(entry.timeout), ch, m_pending.size());
            LOGGER_WARN("RelaySession: {}", message);
            record("request_timeout", id);
            entry.result.set_exception(make_error(RelayErrc::RequestTimeout, message));
        }

        if (now >= m_keepalive_deadline)
        {
            const std::string message = fmt::format(
                "No traffic from relay for {} (channel {}); connection dropped",
                format_duration(m_opts.keepalive_timeout), ch);
            LOGGER_WARN("RelaySession: {}", message);
            record("keepalive_timeout", ch);
            close_socket(RelayErrc::KeepaliveTimeout, message);
            return;
        }

        if (now >= m_next_ping)
        {
            m_next_ping = now + m_opts.ping_interval;
            try
            {
                if (!detail::send_control(*m_socket, protocol::msg::kPing,
                                          nlohmann::json::object()))
                {
                    LOGGER_DEBUG("RelaySession: PING not queued (socket busy)");
                }
            }
            catch (const zmq::error_t &e)
            {
                LOGGER_WARN("RelaySession: PING failed: {}", e.what());
            }
        }
    }

    // ── Settlement ───────────────────────────────────────────────────────────

    void settle_connect_ok()
    {
        if (!m_connect_promise.has_value())
        {
            return;
        }
        m_connect_promise->set_value();
        m_connect_promise.reset();
    }

    void settle_connect_fail(RelayErrc code, const std::string &message, int close_code = 0)
    {
        if (!m_connect_promise.has_value())
        {
            return;
        }
        m_connect_promise->set_exception(make_error(code, message, close_code));
        m_connect_promise.reset();
    }

    void reject_all_pending(RelayErrc code, const std::string &message, int close_code = 0)
    {
        if (m_pending.empty())
        {
            return;
        }
        auto pending = std::move(m_pending);
        m_pending.clear();
        for (auto &[id, entry] : pending)
        {
            release_slot();
            entry.result.set_exception(
                make_error(code, fmt::format("{} (request '{}')", message, id), close_code));
        }
    }

    /// Tears the socket down and fails everything that was waiting on it.
    void close_socket(RelayErrc code, const std::string &message, int close_code = 0,
                      bool send_bye = false)
    {
        if (m_socket.has_value())
        {
            if (send_bye)
            {
                try
                {
                    static_cast<void>(
                        detail::send_control(*m_socket, protocol::msg::kBye, nlohmann::json::object()));
                }
                catch (const zmq::error_t &e)
                {
                    LOGGER_DEBUG("RelaySession: BYE not sent: {}", e.what());
                }
            }
            m_socket->close();
            m_socket.reset();
        }
        m_joined.store(false, std::memory_order_release);
        m_executor_present.store(false, std::memory_order_release);
        reject_all_pending(code, message, close_code);
        settle_connect_fail(code, message, close_code);
    }
};

// ============================================================================
// RelaySession: Pimpl delegation
// ============================================================================

RelaySession::RelaySession() : RelaySession(Options{}) {}

RelaySession::RelaySession(Options options)
    : pImpl(std::make_unique<RelaySessionImpl>(std::move(options)))
{
    pImpl->start_worker();
}

RelaySession::~RelaySession() = default;

std::future<void> RelaySession::connect(const std::string &relay_url,
                                        const std::string &channel_id)
{
    ConnectCmd cmd;
    cmd.url     = relay_url;
    cmd.channel = channel_id;
    auto future = cmd.result.get_future();
    pImpl->enqueue(std::move(cmd));
    return future;
}

std::future<nlohmann::json> RelaySession::send(nlohmann::json envelope,
                                               std::optional<std::chrono::milliseconds> timeout)
{
    if (!envelope.is_object())
    {
        return failed_future<nlohmann::json>(RelayErrc::InvalidArgument,
                                             "Request envelope must be a JSON object");
    }
    std::string id;
    if (const auto it = envelope.find("id"); it != envelope.end())
    {
        if (!it->is_string() || it->get<std::string>().empty())
        {
            return failed_future<nlohmann::json>(RelayErrc::InvalidArgument,
                                                 "Request id must be a non-empty string");
        }
        id = it->get<std::string>();
    }
    else
    {
        try
        {
            id = uid::generate_request_id();
        }
        catch (const std::runtime_error &e)
        {
            return failed_future<nlohmann::json>(RelayErrc::WriteFailed, e.what());
        }
        envelope["id"] = id;
    }

    if (!pImpl->m_joined.load(std::memory_order_acquire))
    {
        return failed_future<nlohmann::json>(
            RelayErrc::NotConnected,
            fmt::format("Not connected to relay (channel '{}'); call connect() first",
                        pImpl->channel()));
    }
    if (!pImpl->m_executor_present.load(std::memory_order_acquire))
    {
        return failed_future<nlohmann::json>(
            RelayErrc::ExecutorNotConnected,
            fmt::format("No executor connected to channel {}", pImpl->channel()));
    }

    const std::size_t in_flight = pImpl->m_pending_count.fetch_add(1, std::memory_order_acq_rel);
    if (in_flight >= pImpl->m_opts.max_pending)
    {
        pImpl->release_slot();
        return failed_future<nlohmann::json>(
            RelayErrc::TooManyPending, fmt::format("Too many pending requests ({})", in_flight));
    }

    SendCmd cmd;
    cmd.envelope = std::move(envelope);
    cmd.id       = std::move(id);
    cmd.timeout  = timeout.value_or(pImpl->m_opts.default_request_timeout);
    auto future  = cmd.result.get_future();
    pImpl->enqueue(std::move(cmd));
    return future;
}

std::future<nlohmann::json> RelaySession::request(const std::string &type, nlohmann::json payload,
                                                  std::optional<std::chrono::milliseconds> timeout)
{
    if (type.empty())
    {
        return failed_future<nlohmann::json>(RelayErrc::InvalidArgument,
                                             "Request type must not be empty");
    }
    nlohmann::json envelope;
    envelope["type"]    = type;
    envelope["payload"] = std::move(payload);
    return send(std::move(envelope), timeout);
}

void RelaySession::send_notification(nlohmann::json envelope)
{
    if (!envelope.is_object())
    {
        LOGGER_WARN("RelaySession: notification must be a JSON object; dropped");
        return;
    }
    pImpl->enqueue(NotifyCmd{std::move(envelope)});
}

void RelaySession::disconnect()
{
    DisconnectCmd cmd;
    auto future = cmd.result.get_future();
    pImpl->enqueue(std::move(cmd));
    future.get();
}

bool RelaySession::is_connected() const noexcept
{
    return pImpl->m_joined.load(std::memory_order_acquire);
}

bool RelaySession::is_executor_connected() const noexcept
{
    return pImpl->m_joined.load(std::memory_order_acquire) &&
           pImpl->m_executor_present.load(std::memory_order_acquire);
}

std::string RelaySession::channel_id() const
{
    return pImpl->channel();
}

std::size_t RelaySession::pending_count() const noexcept
{
    return pImpl->m_pending_count.load(std::memory_order_acquire);
}

std::vector<std::string> RelaySession::pending_request_ids() const
{
    QueryPendingCmd cmd;
    auto future = cmd.result.get_future();
    pImpl->enqueue(std::move(cmd));
    return future.get();
}

std::vector<RelaySession::DebugEvent> RelaySession::debug_events() const
{
    std::lock_guard<std::mutex> lock(pImpl->m_state_mu);
    return std::vector<DebugEvent>(pImpl->m_events.begin(), pImpl->m_events.end());
}

// ============================================================================
// Connection-state persistence
// ============================================================================

bool save_connection_state(const std::string &path, const ConnectionState &state)
{
    namespace fs = std::filesystem;

    nlohmann::json j;
    j["relayUrl"]    = state.relay_url;
    j["channelCode"] = state.channel_code;
    j["savedAt"]     = format_tools::iso8601_utc(std::chrono::system_clock::now());

    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path())
    {
        fs::create_directories(target.parent_path(), ec);
        if (ec)
        {
            LOGGER_WARN("RelaySession: cannot create '{}': {}", target.parent_path().string(),
                        ec.message());
            return false;
        }
    }

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << j.dump(2) << '\n';
        out.flush();
        if (!out)
        {
            LOGGER_WARN("RelaySession: cannot write connection state to '{}'", tmp.string());
            fs::remove(tmp, ec);
            return false;
        }
    }
    fs::rename(tmp, target, ec);
    if (ec)
    {
        LOGGER_WARN("RelaySession: cannot replace '{}': {}", path, ec.message());
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return false;
    }
    return true;
}

std::optional<ConnectionState> load_connection_state(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return std::nullopt;
    }
    try
    {
        const nlohmann::json j = nlohmann::json::parse(in);
        ConnectionState state;
        state.relay_url    = j.value("relayUrl", std::string{});
        state.channel_code = j.value("channelCode", std::string{});
        state.saved_at     = j.value("savedAt", std::string{});
        if (state.relay_url.empty() || state.channel_code.empty())
        {
            return std::nullopt;
        }
        return state;
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_WARN("RelaySession: ignoring unreadable connection state '{}': {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace relayhub::client
