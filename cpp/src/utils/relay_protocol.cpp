#include "utils/relay_protocol.hpp"
#include "utils/format_tools.hpp"

#include <fmt/format.h>

#include <charconv>
#include <stdexcept>

namespace relayhub::protocol
{

namespace
{
constexpr std::string_view kTcpScheme = "tcp://";
constexpr const char *kSystemKind = "system";
} // namespace

std::optional<Role> role_from_str(std::string_view s) noexcept
{
    if (s == "executor" || s == "figma")
        return Role::Executor;
    if (s.empty() || s == "caller" || s == "client")
        return Role::Caller;
    return std::nullopt;
}

std::string normalize_path(std::string_view path)
{
    if (path.empty() || path == "/")
    {
        return "/";
    }
    std::string out;
    if (path.front() != '/')
    {
        out += '/';
    }
    out += path;
    if (out.size() > 1 && out.back() == '/')
    {
        out.pop_back();
    }
    return out;
}

bool is_ipv6_host(std::string_view host) noexcept
{
    return host.find(':') != std::string_view::npos;
}

std::string bracket_host(std::string_view host)
{
    if (is_ipv6_host(host))
    {
        return fmt::format("[{}]", host);
    }
    return std::string(host);
}

RelayUrl parse_relay_url(std::string_view url)
{
    if (url.substr(0, kTcpScheme.size()) != kTcpScheme)
    {
        throw std::invalid_argument(fmt::format("relay URL '{}' must start with tcp://", url));
    }
    std::string_view rest = url.substr(kTcpScheme.size());

    std::string_view query;
    if (const auto q = rest.find('?'); q != std::string_view::npos)
    {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }

    std::string_view path;
    std::string_view authority = rest;
    if (const auto slash = rest.find('/'); slash != std::string_view::npos)
    {
        authority = rest.substr(0, slash);
        path = rest.substr(slash);
    }

    std::string_view host;
    std::string_view port_str;
    if (!authority.empty() && authority.front() == '[')
    {
        const auto close = authority.find(']');
        if (close == std::string_view::npos || close == 1 || close + 1 >= authority.size() ||
            authority[close + 1] != ':')
        {
            throw std::invalid_argument(fmt::format("relay URL '{}' needs [host]:port", url));
        }
        host = authority.substr(1, close - 1);
        port_str = authority.substr(close + 2);
    }
    else
    {
        const auto colon = authority.rfind(':');
        if (colon == std::string_view::npos || colon == 0)
        {
            throw std::invalid_argument(fmt::format("relay URL '{}' needs host:port", url));
        }
        host = authority.substr(0, colon);
        if (is_ipv6_host(host))
        {
            throw std::invalid_argument(
                fmt::format("relay URL '{}': IPv6 hosts must be bracketed", url));
        }
        port_str = authority.substr(colon + 1);
    }

    unsigned port = 0;
    const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 ||
        port > 65535)
    {
        throw std::invalid_argument(fmt::format("relay URL '{}' has an invalid port", url));
    }

    RelayUrl out;
    out.host = std::string(host);
    out.port = static_cast<uint16_t>(port);
    out.endpoint = fmt::format("tcp://{}:{}", bracket_host(host), port);
    out.path = normalize_path(path);
    if (!query.empty())
    {
        out.type = format_tools::extract_value_from_string("type", query, '&', '=');
        out.channel = format_tools::extract_value_from_string("channel", query, '&', '=');
    }
    return out;
}

std::string format_relay_url(const std::string &host, uint16_t port, std::string_view path)
{
    const std::string p = normalize_path(path);
    return fmt::format("tcp://{}:{}{}", bracket_host(host), port, p == "/" ? std::string{} : p);
}

nlohmann::json make_control_envelope(std::string_view event, const std::string &channel)
{
    nlohmann::json env;
    env["kind"] = kSystemKind;
    env["event"] = std::string(event);
    env["channel"] = channel;
    return env;
}

bool is_control_envelope(const nlohmann::json &j) noexcept
{
    if (!j.is_object())
        return false;
    const auto it = j.find("kind");
    return it != j.end() && it->is_string() && it->get_ref<const std::string &>() == kSystemKind;
}

std::string session_tag(const nlohmann::json &j)
{
    if (!j.is_object())
        return {};
    const auto it = j.find("sessionId");
    if (it == j.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

} // namespace relayhub::protocol
