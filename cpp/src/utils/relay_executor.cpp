#include "utils/relay_executor.hpp"

#include "relay_frames.hpp"

#include "utils/logger.hpp"
#include "utils/relay_protocol.hpp"
#include "utils/uid_utils.hpp"
#include "utils/zmq_context.hpp"

#include <zmq.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <vector>

namespace relayhub::client
{

class RelayExecutorImpl
{
  public:
    RelayExecutor::Options opts;
    RelayExecutor::Handler handler;
    std::optional<zmq::socket_t> socket;
    std::string channel;
    int close_code{0};
    std::string close_reason;
    nlohmann::json last_control = nullptr;
    std::chrono::steady_clock::time_point next_ping{};

    /// Waits up to @p timeout for a frame; std::nullopt when none arrived.
    std::optional<detail::Inbound> wait_inbound(std::chrono::milliseconds timeout)
    {
        std::vector<zmq::pollitem_t> items = {{socket->handle(), 0, ZMQ_POLLIN, 0}};
        zmq::poll(items, timeout);
        if ((items[0].revents & ZMQ_POLLIN) == 0)
        {
            return std::nullopt;
        }
        return detail::recv_inbound(*socket);
    }

    void drop_socket()
    {
        if (socket.has_value())
        {
            socket->close();
            socket.reset();
        }
    }

    void handle_close(const nlohmann::json &body)
    {
        close_code   = body.value("code", 0);
        close_reason = body.value("reason", std::string{});
        LOGGER_WARN("Executor: relay closed channel '{}' (code {}): {}", channel, close_code,
                    close_reason);
        drop_socket();
    }

    void handle_request(const nlohmann::json &env)
    {
        const auto id_it = env.find("id");
        if (id_it == env.end() || !id_it->is_string())
        {
            LOGGER_DEBUG("Executor: envelope without id; dropped");
            return;
        }
        nlohmann::json response;
        response["id"] = *id_it;
        if (opts.tag_session)
        {
            response["sessionId"] = opts.session_id;
        }

        const std::string type = env.value("type", std::string{});
        const nlohmann::json payload = env.contains("payload") ? env["payload"] : nlohmann::json::object();
        if (!handler)
        {
            response["error"] = fmt::format("No handler for '{}'", type);
        }
        else
        {
            try
            {
                response["result"] = handler(type, payload);
            }
            catch (const std::exception &e)
            {
                response["error"] = e.what();
            }
        }
        if (!detail::send_data(*socket, response.dump()))
        {
            LOGGER_WARN("Executor: response to '{}' dropped (socket busy)",
                        id_it->get<std::string>());
        }
    }

    void process(const detail::Inbound &in)
    {
        if (in.kind == 0)
        {
            LOGGER_WARN("Executor: malformed frame from relay; dropped");
            return;
        }
        try
        {
            const nlohmann::json body = nlohmann::json::parse(in.body);
            if (in.kind == protocol::kFrameTypeData)
            {
                if (body.is_object())
                {
                    handle_request(body);
                }
            }
            else if (in.msg_type == protocol::msg::kSystem)
            {
                last_control = body;
            }
            else if (in.msg_type == protocol::msg::kClose)
            {
                handle_close(body);
            }
        }
        catch (const nlohmann::json::exception &e)
        {
            LOGGER_WARN("Executor: invalid message from relay: {}", e.what());
        }
    }
};

RelayExecutor::RelayExecutor() : RelayExecutor(Options{}) {}

RelayExecutor::RelayExecutor(Options options) : pImpl(std::make_unique<RelayExecutorImpl>())
{
    pImpl->opts = std::move(options);
    if (pImpl->opts.session_id.empty())
    {
        pImpl->opts.session_id = uid::generate_session_id();
    }
}

RelayExecutor::~RelayExecutor()
{
    close();
}

std::string RelayExecutor::connect(const std::string &relay_url, const std::string &channel,
                                   std::chrono::milliseconds timeout)
{
    close();
    pImpl->close_code = 0;
    pImpl->close_reason.clear();
    pImpl->last_control = nullptr;

    protocol::RelayUrl url;
    try
    {
        url = protocol::parse_relay_url(relay_url);
    }
    catch (const std::invalid_argument &e)
    {
        throw RelayError(RelayErrc::InvalidArgument, e.what());
    }
    const std::string requested = !channel.empty() ? channel : url.channel.value_or("");

    try
    {
        pImpl->socket.emplace(get_zmq_context(), zmq::socket_type::dealer);
        pImpl->socket->set(zmq::sockopt::linger, 0);
        if (protocol::is_ipv6_host(url.host))
        {
            pImpl->socket->set(zmq::sockopt::ipv6, 1);
        }
        if (!pImpl->opts.server_key.empty())
        {
            detail::apply_curve_client(*pImpl->socket, pImpl->opts.server_key);
        }
        pImpl->socket->connect(url.endpoint);
    }
    catch (const zmq::error_t &e)
    {
        pImpl->drop_socket();
        throw RelayError(RelayErrc::RelayUnreachable,
                         fmt::format("Cannot open a socket to {}: {}", url.endpoint, e.what()));
    }
    catch (const std::runtime_error &e)
    {
        pImpl->drop_socket();
        throw RelayError(RelayErrc::InvalidArgument, e.what());
    }

    nlohmann::json hello;
    hello["path"] = url.path;
    hello["type"] = protocol::role_to_str(protocol::Role::Executor);
    if (!requested.empty())
    {
        hello["channel"] = requested;
    }
    hello["sessionId"] = pImpl->opts.session_id;
    if (!detail::send_control(*pImpl->socket, protocol::msg::kHello, hello))
    {
        pImpl->drop_socket();
        throw RelayError(RelayErrc::WriteFailed, "Could not queue HELLO to " + relay_url);
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (pImpl->socket.has_value())
    {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
        {
            break;
        }
        const auto in = pImpl->wait_inbound(remaining);
        if (!in.has_value())
        {
            continue;
        }
        pImpl->process(*in);
        const auto &ctl = pImpl->last_control;
        if (ctl.is_object() && ctl.value("event", std::string{}) == protocol::event::kConnected)
        {
            pImpl->channel   = ctl.value("channel", requested);
            pImpl->next_ping = std::chrono::steady_clock::now() + pImpl->opts.ping_interval;
            LOGGER_INFO("Executor: serving channel '{}' (session {})", pImpl->channel,
                        pImpl->opts.session_id);
            return pImpl->channel;
        }
    }

    if (!pImpl->socket.has_value())
    {
        throw RelayError(RelayErrc::Rejected,
                         fmt::format("Relay rejected executor (code {}): {}", pImpl->close_code,
                                     pImpl->close_reason),
                         pImpl->close_code);
    }
    pImpl->drop_socket();
    throw RelayError(RelayErrc::RelayUnreachable,
                     fmt::format("Relay at {} did not answer within {}ms", relay_url,
                                 timeout.count()));
}

void RelayExecutor::set_handler(Handler handler)
{
    pImpl->handler = std::move(handler);
}

bool RelayExecutor::poll_once(std::chrono::milliseconds timeout)
{
    if (!pImpl->socket.has_value())
    {
        return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= pImpl->next_ping)
    {
        pImpl->next_ping = now + pImpl->opts.ping_interval;
        static_cast<void>(
            detail::send_control(*pImpl->socket, protocol::msg::kPing, nlohmann::json::object()));
    }
    const auto in = pImpl->wait_inbound(timeout);
    if (!in.has_value())
    {
        return false;
    }
    pImpl->process(*in);
    return true;
}

bool RelayExecutor::send_raw(const nlohmann::json &envelope)
{
    if (!pImpl->socket.has_value())
    {
        return false;
    }
    return detail::send_data(*pImpl->socket, envelope.dump());
}

void RelayExecutor::close()
{
    if (!pImpl->socket.has_value())
    {
        return;
    }
    try
    {
        static_cast<void>(
            detail::send_control(*pImpl->socket, protocol::msg::kBye, nlohmann::json::object()));
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_DEBUG("Executor: BYE not sent: {}", e.what());
    }
    pImpl->drop_socket();
}

bool RelayExecutor::is_open() const noexcept
{
    return pImpl->socket.has_value();
}

const std::string &RelayExecutor::channel_id() const noexcept
{
    return pImpl->channel;
}

const std::string &RelayExecutor::session_id() const noexcept
{
    return pImpl->opts.session_id;
}

int RelayExecutor::close_code() const noexcept
{
    return pImpl->close_code;
}

const std::string &RelayExecutor::close_reason() const noexcept
{
    return pImpl->close_reason;
}

const nlohmann::json &RelayExecutor::last_control_event() const noexcept
{
    return pImpl->last_control;
}

} // namespace relayhub::client
