/**
 * @file test_relay_session.cpp
 * @brief RelaySession against a live broker: pairing, correlation, timeouts, teardown.
 *
 * The executor side is either a RelayExecutor pumped on a background thread
 * (ExecutorThread) or a RawPeer when the test needs to control exactly what the
 * executor writes (stale tags, withheld answers).
 */
#include "relay_test_helpers.h"

#include "utils/logger.hpp"
#include "utils/relay_executor.hpp"
#include "utils/relay_session.hpp"
#include "rh_platform.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

using namespace relayhub;
using namespace relayhub::tests;
using client::RelayErrc;
using client::RelayError;
using client::RelaySession;
using nlohmann::json;

namespace
{

/// A RelayExecutor joined to a channel and pumped on its own thread until destroyed.
class ExecutorThread
{
  public:
    ExecutorThread(const std::string &url, client::RelayExecutor::Handler handler,
                   const std::string &channel = {})
    {
        m_channel = m_exec.connect(url, channel);
        m_exec.set_handler(std::move(handler));
        m_thread = std::thread(
            [this]
            {
                while (!m_stop.load() && m_exec.is_open())
                    m_exec.poll_once(std::chrono::milliseconds(10));
            });
    }

    ~ExecutorThread() { stop(); }

    ExecutorThread(const ExecutorThread &) = delete;
    ExecutorThread &operator=(const ExecutorThread &) = delete;

    /// Joins the pump thread and sends BYE.
    void stop()
    {
        m_stop.store(true);
        if (m_thread.joinable())
            m_thread.join();
        m_exec.close();
    }

    const std::string &channel() const { return m_channel; }
    const std::string &session_id() const { return m_exec.session_id(); }

  private:
    client::RelayExecutor m_exec;
    std::string m_channel;
    std::atomic<bool> m_stop{false};
    std::thread m_thread;
};

json demo_handler(const std::string &type, const json &payload)
{
    if (type == "ping")
        return json{{"pong", true}};
    if (type == "echo")
        return payload;
    if (type == "slow")
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return json{{"late", true}};
    }
    if (type == "fail")
        throw std::runtime_error("node not found: 1:23");
    throw std::runtime_error("unknown command: " + type);
}

/// Runs @p f and returns the RelayError it throws; fails the test if it throws nothing.
template <typename F> RelayError expect_relay_error(F &&f)
{
    try
    {
        f();
    }
    catch (const RelayError &e)
    {
        return e;
    }
    ADD_FAILURE() << "expected a RelayError";
    return RelayError(RelayErrc::InvalidArgument, "none");
}

RelaySession::Options fast_options()
{
    RelaySession::Options o;
    o.connect_timeout = std::chrono::seconds(3);
    o.default_request_timeout = std::chrono::seconds(3);
    return o;
}

bool has_event(const RelaySession &s, const std::string &name)
{
    const auto events = s.debug_events();
    return std::any_of(events.begin(), events.end(),
                       [&](const RelaySession::DebugEvent &e) { return e.event == name; });
}

} // namespace

class RelaySessionTest : public ::testing::Test
{
  protected:
    static void SetUpTestSuite()
    {
        utils::Logger::instance().set_level(utils::Logger::Level::L_ERROR);
    }
};

// ============================================================================
// Request / response
// ============================================================================

TEST_F(RelaySessionTest, PingResolvesAndTimedOutRequestIsForgotten)
{
    auto broker = start_broker_in_thread();
    ExecutorThread exec(broker.url, demo_handler);

    RelaySession session(fast_options());
    ASSERT_NO_THROW(session.connect(broker.url, exec.channel()).get());
    EXPECT_TRUE(session.is_connected());
    EXPECT_TRUE(session.is_executor_connected());
    EXPECT_EQ(session.channel_id(), exec.channel());

    const json r1 = session.send(json{{"id", "r1"}, {"type", "ping"}, {"payload", json::object()}}).get();
    EXPECT_EQ(r1, (json{{"pong", true}}));

    auto r2 = session.send(json{{"id", "r2"}, {"type", "slow"}}, std::chrono::milliseconds(50));
    const auto err = expect_relay_error([&] { r2.get(); });
    EXPECT_EQ(err.code(), RelayErrc::RequestTimeout);
    EXPECT_NE(std::string(err.what()).find("r2"), std::string::npos) << err.what();
    EXPECT_NE(std::string(err.what()).find("50ms"), std::string::npos) << err.what();
    EXPECT_STREQ(client::error_code_string(err.code()), "E_TIMEOUT");

    const auto ids = session.pending_request_ids();
    EXPECT_EQ(std::find(ids.begin(), ids.end(), "r2"), ids.end());
    EXPECT_EQ(session.pending_count(), 0u);

    // The late answer to r2 arrives and is dropped without disturbing anything.
    EXPECT_TRUE(wait_for([&] { return has_event(session, "unmatched_response"); }, 2000ms));
    EXPECT_EQ(session.request("ping").get(), (json{{"pong", true}}));
}

TEST_F(RelaySessionTest, RequestBuildsEnvelopeWithFreshId)
{
    auto broker = start_broker_in_thread();
    ExecutorThread exec(broker.url, demo_handler);

    RelaySession session(fast_options());
    session.connect(broker.url, exec.channel()).get();

    const json payload{{"nodeId", "1:23"}, {"depth", 2}};
    EXPECT_EQ(session.request("echo", payload).get(), payload);
}

TEST_F(RelaySessionTest, ExecutorErrorBecomesRemoteError)
{
    auto broker = start_broker_in_thread();
    ExecutorThread exec(broker.url, demo_handler);

    RelaySession session(fast_options());
    session.connect(broker.url, exec.channel()).get();

    auto f = session.request("fail");
    const auto err = expect_relay_error([&] { f.get(); });
    EXPECT_EQ(err.code(), RelayErrc::RemoteError);
    EXPECT_NE(std::string(err.what()).find("node not found"), std::string::npos) << err.what();
    EXPECT_EQ(session.pending_count(), 0u);
}

TEST_F(RelaySessionTest, ConcurrentRequestsAreCorrelatedById)
{
    auto broker = start_broker_in_thread();
    ExecutorThread exec(broker.url, demo_handler);

    RelaySession session(fast_options());
    session.connect(broker.url, exec.channel()).get();

    std::vector<std::future<json>> futures;
    for (int i = 0; i < 20; ++i)
        futures.push_back(session.request("echo", json{{"n", i}}));
    for (int i = 0; i < 20; ++i)
        EXPECT_EQ(futures[static_cast<size_t>(i)].get(), (json{{"n", i}}));
}

TEST_F(RelaySessionTest, NotificationCreatesNoPendingRequest)
{
    auto broker = start_broker_in_thread();
    RawPeer exec(broker.endpoint);
    const std::string channel = exec.join_as_executor();

    RelaySession session(fast_options());
    session.connect(broker.url, channel).get();

    session.send_notification(json{{"type", "log"}, {"message", "hi"}});
    auto f = exec.recv_until([](const Frame &fr) { return fr.kind == 'A'; });
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->json().value("type", ""), "log");
    EXPECT_EQ(session.pending_count(), 0u);
}

// ============================================================================
// Input validation and admission
// ============================================================================

TEST_F(RelaySessionTest, SendBeforeConnectFailsFast)
{
    RelaySession session(fast_options());
    const auto err = expect_relay_error([&] { session.request("ping").get(); });
    EXPECT_EQ(err.code(), RelayErrc::NotConnected);
    EXPECT_STREQ(client::error_code_string(err.code()), "E_NOT_CONNECTED");
}

TEST_F(RelaySessionTest, InvalidEnvelopesAreRejected)
{
    RelaySession session(fast_options());
    EXPECT_EQ(expect_relay_error([&] { session.send(json::array()).get(); }).code(),
              RelayErrc::InvalidArgument);
    EXPECT_EQ(expect_relay_error([&] { session.send(json{{"id", 5}}).get(); }).code(),
              RelayErrc::InvalidArgument);
    EXPECT_EQ(expect_relay_error([&] { session.request("").get(); }).code(),
              RelayErrc::InvalidArgument);
}

TEST_F(RelaySessionTest, ConnectValidatesUrlAndChannel)
{
    RelaySession session(fast_options());
    EXPECT_EQ(expect_relay_error([&] { session.connect("http://x:1", "CHAN0001").get(); }).code(),
              RelayErrc::InvalidArgument);
    EXPECT_EQ(expect_relay_error([&] { session.connect("tcp://127.0.0.1:1").get(); }).code(),
              RelayErrc::InvalidArgument);
    EXPECT_EQ(expect_relay_error(
                  [&] { session.connect("tcp://127.0.0.1:1?type=executor", "CHAN0001").get(); })
                  .code(),
              RelayErrc::InvalidArgument);
}

TEST_F(RelaySessionTest, ChannelFromUrlQueryIsUsed)
{
    auto broker = start_broker_in_thread();
    ExecutorThread exec(broker.url, demo_handler);

    RelaySession session(fast_options());
    session.connect(broker.url + "?type=caller&channel=" + exec.channel()).get();
    EXPECT_EQ(session.channel_id(), exec.channel());
}

TEST_F(RelaySessionTest, TooManyPendingIsRejectedImmediately)
{
    auto broker = start_broker_in_thread();
    RawPeer exec(broker.endpoint);
    const std::string channel = exec.join_as_executor();

    auto opts = fast_options();
    opts.max_pending = 2;
    RelaySession session(opts);
    session.connect(broker.url, channel).get();

    auto a = session.request("ping", json::object(), std::chrono::seconds(5));
    auto b = session.request("ping", json::object(), std::chrono::seconds(5));
    const auto err = expect_relay_error([&] { session.request("ping").get(); });
    EXPECT_EQ(err.code(), RelayErrc::TooManyPending);
    EXPECT_STREQ(err.what(), "Too many pending requests (2)");

    // Nothing answers; leaving the channel rejects what is still in flight.
    session.disconnect();
    EXPECT_EQ(expect_relay_error([&] { a.get(); }).code(), RelayErrc::Disconnected);
    EXPECT_EQ(expect_relay_error([&] { b.get(); }).code(), RelayErrc::Disconnected);
    EXPECT_EQ(session.pending_count(), 0u);
    EXPECT_FALSE(session.is_connected());
}

// ============================================================================
// Connect outcomes
// ============================================================================

TEST_F(RelaySessionTest, NoExecutorWithinWindowIsExecutorNotConnected)
{
    auto broker = start_broker_in_thread();
    auto opts = fast_options();
    opts.connect_timeout = std::chrono::milliseconds(200);
    RelaySession session(opts);

    const auto err = expect_relay_error([&] { session.connect(broker.url, "WAIT0001").get(); });
    EXPECT_EQ(err.code(), RelayErrc::ExecutorNotConnected);
    EXPECT_NE(std::string(err.what()).find("WAIT0001"), std::string::npos) << err.what();
    EXPECT_TRUE(session.is_connected());
    EXPECT_FALSE(session.is_executor_connected());
    EXPECT_EQ(expect_relay_error([&] { session.request("ping").get(); }).code(),
              RelayErrc::ExecutorNotConnected);

    // The socket stays joined, so a late executor still pairs it.
    ExecutorThread exec(broker.url, demo_handler, "WAIT0001");
    EXPECT_TRUE(wait_for([&] { return session.is_executor_connected(); }));
    EXPECT_EQ(session.request("ping").get(), (json{{"pong", true}}));
}

TEST_F(RelaySessionTest, ExecutorArrivingDuringConnectResolvesIt)
{
    auto broker = start_broker_in_thread();
    RelaySession session(fast_options());
    auto connected = session.connect(broker.url, "LATE0001");

    ASSERT_TRUE(wait_for([&] { return session.is_connected(); }));
    EXPECT_EQ(connected.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    ExecutorThread exec(broker.url, demo_handler, "LATE0001");
    EXPECT_NO_THROW(connected.get());
    EXPECT_TRUE(session.is_executor_connected());
}

TEST_F(RelaySessionTest, SilentRelayIsRelayUnreachable)
{
    std::string url;
    {
        auto broker = start_broker_in_thread();
        url = broker.url;
    }
    auto opts = fast_options();
    opts.connect_timeout = std::chrono::milliseconds(300);
    RelaySession session(opts);

    const auto err = expect_relay_error([&] { session.connect(url, "GONE0001").get(); });
    EXPECT_EQ(err.code(), RelayErrc::RelayUnreachable);
    EXPECT_NE(std::string(err.what()).find("300ms"), std::string::npos) << err.what();
    EXPECT_FALSE(session.is_connected());
}

TEST_F(RelaySessionTest, WrongPathIsRejectedWithCloseCode)
{
    broker::RelayBroker::Config cfg;
    cfg.path = "/relay";
    auto broker = start_broker_in_thread(cfg);

    RelaySession session(fast_options());
    const auto err =
        expect_relay_error([&] { session.connect(broker.endpoint + "/other", "CHAN0001").get(); });
    EXPECT_EQ(err.code(), RelayErrc::Rejected);
    EXPECT_EQ(err.close_code(), protocol::close_code::kInvalidPath);
    EXPECT_FALSE(session.is_connected());
}

// ============================================================================
// Teardown paths
// ============================================================================

TEST_F(RelaySessionTest, ExecutorLeavingRejectsPending)
{
    auto broker = start_broker_in_thread();
    RawPeer exec(broker.endpoint);
    const std::string channel = exec.join_as_executor({}, "sess-1");

    RelaySession session(fast_options());
    session.connect(broker.url, channel).get();
    auto pending = session.request("ping", json::object(), std::chrono::seconds(5));
    ASSERT_TRUE(exec.recv_until([](const Frame &f) { return f.kind == 'A'; }).has_value());

    exec.send_control(protocol::msg::kBye, json::object());
    const auto err = expect_relay_error([&] { pending.get(); });
    EXPECT_EQ(err.code(), RelayErrc::ExecutorDisconnected);
    EXPECT_NE(std::string(err.what()).find(channel), std::string::npos) << err.what();
    EXPECT_FALSE(session.is_executor_connected());
    EXPECT_TRUE(session.is_connected());
}

TEST_F(RelaySessionTest, EnvelopeFromReplacedExecutorSessionIsDropped)
{
    auto broker = start_broker_in_thread();
    RawPeer first(broker.endpoint);
    const std::string channel = first.join_as_executor({}, "sess-old");

    RelaySession session(fast_options());
    session.connect(broker.url, channel).get();

    RawPeer second(broker.endpoint);
    ASSERT_EQ(second.join_as_executor(channel, "sess-new"), channel);
    ASSERT_TRUE(wait_for([&] { return has_event(session, "executor_connected"); }));

    auto f = session.send(json{{"id", "req-stale"}, {"type", "ping"}}, std::chrono::seconds(3));
    ASSERT_TRUE(second.recv_until([](const Frame &fr) { return fr.kind == 'A'; }).has_value());

    second.send_data(json{{"id", "req-stale"}, {"sessionId", "sess-old"}, {"result", "stale"}}.dump());
    second.send_data(json{{"id", "req-stale"}, {"sessionId", "sess-new"}, {"result", "fresh"}}.dump());
    EXPECT_EQ(f.get(), json("fresh"));
    EXPECT_TRUE(has_event(session, "stale_drop"));
}

TEST_F(RelaySessionTest, SilenceBeyondKeepaliveDropsConnection)
{
    auto broker = start_broker_in_thread();
    RawPeer exec(broker.endpoint);
    const std::string channel = exec.join_as_executor();

    auto opts = fast_options();
    opts.ping_interval = std::chrono::seconds(30);
    opts.keepalive_timeout = std::chrono::milliseconds(400);
    RelaySession session(opts);
    session.connect(broker.url, channel).get();
    auto pending = session.request("ping", json::object(), std::chrono::seconds(5));

    const auto err = expect_relay_error([&] { pending.get(); });
    EXPECT_EQ(err.code(), RelayErrc::KeepaliveTimeout);
    EXPECT_FALSE(session.is_connected());
    EXPECT_TRUE(has_event(session, "keepalive_timeout"));
}

TEST_F(RelaySessionTest, BrokerShutdownRejectsPendingWithCloseCode)
{
    auto broker = start_broker_in_thread();
    RawPeer exec(broker.endpoint);
    const std::string channel = exec.join_as_executor();

    RelaySession session(fast_options());
    session.connect(broker.url, channel).get();
    auto pending = session.request("ping", json::object(), std::chrono::seconds(5));
    ASSERT_TRUE(exec.recv_until([](const Frame &f) { return f.kind == 'A'; }).has_value());

    broker.stop_and_join();
    const auto err = expect_relay_error([&] { pending.get(); });
    EXPECT_EQ(err.code(), RelayErrc::Disconnected);
    EXPECT_EQ(err.close_code(), protocol::close_code::kGoingAway);
    EXPECT_FALSE(session.is_connected());
}

TEST_F(RelaySessionTest, ReconnectReplacesPreviousSocket)
{
    auto broker = start_broker_in_thread();
    ExecutorThread a(broker.url, demo_handler);
    ExecutorThread b(broker.url, demo_handler);

    RelaySession session(fast_options());
    session.connect(broker.url, a.channel()).get();
    session.connect(broker.url, b.channel()).get();
    EXPECT_EQ(session.channel_id(), b.channel());
    EXPECT_EQ(session.request("ping").get(), (json{{"pong", true}}));
    EXPECT_TRUE(wait_for([&] { return broker.service->channel_count() == 2; }));
}

// ============================================================================
// Connection state persistence
// ============================================================================

TEST_F(RelaySessionTest, ConnectionStateRoundTrip)
{
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() /
                         ("relayhub-state-" + std::to_string(platform::get_pid()));
    const fs::path file = dir / "nested" / "connection.json";
    fs::remove_all(dir);

    EXPECT_FALSE(client::load_connection_state(file.string()).has_value());

    client::ConnectionState state;
    state.relay_url = "tcp://127.0.0.1:8888";
    state.channel_code = "AB12CD34";
    ASSERT_TRUE(client::save_connection_state(file.string(), state));

    const auto loaded = client::load_connection_state(file.string());
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->relay_url, state.relay_url);
    EXPECT_EQ(loaded->channel_code, state.channel_code);
    EXPECT_FALSE(loaded->saved_at.empty());
    EXPECT_EQ(loaded->saved_at.back(), 'Z');

    std::ofstream(file) << R"({"relayUrl": "tcp://127.0.0.1:8888"})";
    EXPECT_FALSE(client::load_connection_state(file.string()).has_value());
    std::ofstream(file) << "garbage";
    EXPECT_FALSE(client::load_connection_state(file.string()).has_value());

    fs::remove_all(dir);
}
