/**
 * @file test_relay_protocol.cpp
 * @brief Wire vocabulary helpers, id minting and error classification.
 */
#include "utils/format_tools.hpp"
#include "utils/relay_error.hpp"
#include "utils/relay_protocol.hpp"
#include "utils/uid_utils.hpp"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>

using namespace relayhub;

// ============================================================================
// Roles and paths
// ============================================================================

TEST(RelayProtocolTest, RoleFromStrAcceptsAliases)
{
    EXPECT_EQ(protocol::role_from_str("executor"), protocol::Role::Executor);
    EXPECT_EQ(protocol::role_from_str("figma"), protocol::Role::Executor);
    EXPECT_EQ(protocol::role_from_str("caller"), protocol::Role::Caller);
    EXPECT_EQ(protocol::role_from_str("client"), protocol::Role::Caller);
    EXPECT_EQ(protocol::role_from_str(""), protocol::Role::Caller);
    EXPECT_FALSE(protocol::role_from_str("observer").has_value());
    EXPECT_FALSE(protocol::role_from_str("Executor").has_value());
}

TEST(RelayProtocolTest, NormalizePath)
{
    EXPECT_EQ(protocol::normalize_path(""), "/");
    EXPECT_EQ(protocol::normalize_path("/"), "/");
    EXPECT_EQ(protocol::normalize_path("relay"), "/relay");
    EXPECT_EQ(protocol::normalize_path("/relay/"), "/relay");
    EXPECT_EQ(protocol::normalize_path("/a/b"), "/a/b");
}

// ============================================================================
// Relay URLs
// ============================================================================

TEST(RelayProtocolTest, ParseRelayUrlWithPathAndQuery)
{
    const auto u = protocol::parse_relay_url("tcp://127.0.0.1:8888/relay/?type=caller&channel=AB12CD34");
    EXPECT_EQ(u.endpoint, "tcp://127.0.0.1:8888");
    EXPECT_EQ(u.host, "127.0.0.1");
    EXPECT_EQ(u.port, 8888);
    EXPECT_EQ(u.path, "/relay");
    EXPECT_EQ(u.type, std::optional<std::string>("caller"));
    EXPECT_EQ(u.channel, std::optional<std::string>("AB12CD34"));
}

TEST(RelayProtocolTest, ParseRelayUrlMinimal)
{
    const auto u = protocol::parse_relay_url("tcp://localhost:9000");
    EXPECT_EQ(u.endpoint, "tcp://localhost:9000");
    EXPECT_EQ(u.path, "/");
    EXPECT_FALSE(u.type.has_value());
    EXPECT_FALSE(u.channel.has_value());
}

TEST(RelayProtocolTest, ParseRelayUrlRejectsMalformed)
{
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("ws://host:1")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://host")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://:8888")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://host:0")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://host:70000")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://host:88x")), std::invalid_argument);
}

TEST(RelayProtocolTest, FormatRelayUrlOmitsRootPath)
{
    EXPECT_EQ(protocol::format_relay_url("127.0.0.1", 8888, "/"), "tcp://127.0.0.1:8888");
    EXPECT_EQ(protocol::format_relay_url("127.0.0.1", 8888, "relay/"), "tcp://127.0.0.1:8888/relay");
}

TEST(RelayProtocolTest, Ipv6HostsAreBracketed)
{
    EXPECT_TRUE(protocol::is_ipv6_host("::1"));
    EXPECT_FALSE(protocol::is_ipv6_host("127.0.0.1"));
    EXPECT_EQ(protocol::bracket_host("::1"), "[::1]");
    EXPECT_EQ(protocol::bracket_host("localhost"), "localhost");
    EXPECT_EQ(protocol::format_relay_url("::1", 8888, "/"), "tcp://[::1]:8888");

    const auto u = protocol::parse_relay_url("tcp://[::1]:8888/relay");
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, 8888);
    EXPECT_EQ(u.endpoint, "tcp://[::1]:8888");
    EXPECT_EQ(u.path, "/relay");

    // What the broker hands out parses back to the same endpoint.
    const auto back = protocol::parse_relay_url(protocol::format_relay_url("::1", 8888, "/relay"));
    EXPECT_EQ(back.endpoint, u.endpoint);
    EXPECT_EQ(back.host, "::1");

    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://::1:8888")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://[::1]")), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(protocol::parse_relay_url("tcp://[]:8888")), std::invalid_argument);
}

// ============================================================================
// Control envelopes
// ============================================================================

TEST(RelayProtocolTest, ControlEnvelopeShape)
{
    const auto env = protocol::make_control_envelope(protocol::event::kExecutorConnected, "CHAN0001");
    EXPECT_EQ(env["kind"], "system");
    EXPECT_EQ(env["event"], "executor_connected");
    EXPECT_EQ(env["channel"], "CHAN0001");
    EXPECT_TRUE(protocol::is_control_envelope(env));
}

TEST(RelayProtocolTest, ApplicationEnvelopeIsNotControl)
{
    EXPECT_FALSE(protocol::is_control_envelope(nlohmann::json{{"id", "r1"}, {"result", 1}}));
    EXPECT_FALSE(protocol::is_control_envelope(nlohmann::json{{"kind", 5}}));
    EXPECT_FALSE(protocol::is_control_envelope(nlohmann::json::array()));
}

TEST(RelayProtocolTest, SessionTag)
{
    EXPECT_EQ(protocol::session_tag(nlohmann::json{{"sessionId", "abc"}}), "abc");
    EXPECT_EQ(protocol::session_tag(nlohmann::json{{"sessionId", 7}}), "");
    EXPECT_EQ(protocol::session_tag(nlohmann::json::object()), "");
    EXPECT_EQ(protocol::session_tag(nlohmann::json("text")), "");
}

// ============================================================================
// Ids
// ============================================================================

TEST(RelayProtocolTest, MintedChannelIdsHaveFixedShape)
{
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i)
    {
        const auto id = uid::generate_channel_id();
        EXPECT_TRUE(uid::is_minted_channel_id(id)) << id;
        seen.insert(id);
    }
    EXPECT_GT(seen.size(), 195u);

    EXPECT_FALSE(uid::is_minted_channel_id("abcd1234"));
    EXPECT_FALSE(uid::is_minted_channel_id("ABCD123"));
    EXPECT_FALSE(uid::is_minted_channel_id("ABCD-234"));
}

TEST(RelayProtocolTest, RequestIdsAreUnique)
{
    const auto a = uid::generate_request_id();
    const auto b = uid::generate_request_id();
    EXPECT_NE(a, b);
    EXPECT_EQ(a.rfind("req-", 0), 0u);
    EXPECT_EQ(uid::generate_session_id().size(), 16u);
}

TEST(RelayProtocolTest, GeneratorsDrawFromAnInitializedCsprng)
{
    // The generators refuse to run on an uninitialized libsodium instead of
    // emitting ids built from zero-filled bytes.
    ASSERT_TRUE(crypto::ensure_sodium_init());
    const std::string zero_request = "req-" + std::string(32, '0');
    for (int i = 0; i < 20; ++i)
    {
        std::string request;
        std::string session;
        std::string channel;
        ASSERT_NO_THROW(request = uid::generate_request_id());
        ASSERT_NO_THROW(session = uid::generate_session_id());
        ASSERT_NO_THROW(channel = uid::generate_channel_id());
        EXPECT_NE(request, zero_request);
        EXPECT_NE(session, std::string(16, '0'));
        EXPECT_NE(channel, "AAAAAAAA");
    }
}

// ============================================================================
// Error classification
// ============================================================================

TEST(RelayErrorTest, ErrorCodeStrings)
{
    using client::RelayErrc;
    EXPECT_STREQ(client::error_code_string(RelayErrc::NotConnected), "E_NOT_CONNECTED");
    EXPECT_STREQ(client::error_code_string(RelayErrc::ExecutorNotConnected), "E_NOT_CONNECTED");
    EXPECT_STREQ(client::error_code_string(RelayErrc::RequestTimeout), "E_TIMEOUT");
    EXPECT_STREQ(client::error_code_string(RelayErrc::RemoteError), "E_REMOTE");
    EXPECT_STREQ(client::error_code_string(RelayErrc::InvalidArgument), "E_INVALID_INPUT");
    // A full pending table clears as requests settle, so it is retryable like a timeout.
    EXPECT_STREQ(client::error_code_string(RelayErrc::TooManyPending), "E_TIMEOUT");
    EXPECT_STREQ(client::error_code_string(RelayErrc::WriteFailed), "E_INTERNAL");
    EXPECT_STREQ(client::to_string(RelayErrc::KeepaliveTimeout), "KeepaliveTimeout");
}

TEST(RelayErrorTest, CarriesCloseCode)
{
    const client::RelayError e(client::RelayErrc::Rejected, "rejected", 4004);
    EXPECT_EQ(e.code(), client::RelayErrc::Rejected);
    EXPECT_EQ(e.close_code(), 4004);
    EXPECT_STREQ(e.what(), "rejected");
    EXPECT_EQ(client::RelayError(client::RelayErrc::WriteFailed, "x").close_code(), 0);
}

// ============================================================================
// format_tools
// ============================================================================

TEST(FormatToolsTest, ExtractValueFromString)
{
    using format_tools::extract_value_from_string;
    EXPECT_EQ(extract_value_from_string("b", "a=1; b = 2 ;c=3"), std::optional<std::string>("2"));
    EXPECT_EQ(extract_value_from_string("x", "a=1;b=2"), std::nullopt);
    EXPECT_EQ(extract_value_from_string("a", "a=1&a=2", '&'), std::optional<std::string>("1"));
}

TEST(FormatToolsTest, TrimWhitespace)
{
    EXPECT_EQ(format_tools::trim_whitespace("  x y \t\n"), "x y");
    EXPECT_EQ(format_tools::trim_whitespace("   "), "");
}

TEST(FormatToolsTest, Iso8601Utc)
{
    const auto epoch = std::chrono::system_clock::time_point{};
    const auto s = format_tools::iso8601_utc(epoch);
    EXPECT_EQ(s.rfind("1970-01-01T00:00:00", 0), 0u) << s;
    EXPECT_EQ(s.back(), 'Z');
}
