#pragma once
/**
 * @file relay_frames.hpp
 * @brief DEALER-side framing helpers shared by RelaySession and RelayExecutor.
 *
 * Layouts (no identity frame on the DEALER side):
 *   ['C', msg_type, json_body]
 *   ['A', payload]
 *
 * This is a private implementation header, not part of the installed public API.
 */
#include "utils/relay_protocol.hpp"

#include <zmq.hpp>
#include <zmq_addon.hpp>
#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace relayhub::client::detail
{

// Z85 keypair buffer: 40 printable chars + null terminator
constexpr size_t kZ85KeyBufSize = 41;
constexpr size_t kZ85KeyLen = 40;

inline bool is_valid_z85_key(const std::string &key)
{
    return key.size() == kZ85KeyLen;
}

/**
 * @brief Configure @p socket as a CurveZMQ client of @p server_key with a fresh keypair.
 * @throws std::runtime_error on an invalid key or keypair failure.
 */
inline void apply_curve_client(zmq::socket_t &socket, const std::string &server_key)
{
    if (!is_valid_z85_key(server_key))
    {
        throw std::runtime_error("Invalid relay public key format (expected 40-char Z85)");
    }
    std::array<char, kZ85KeyBufSize> z85_public{};
    std::array<char, kZ85KeyBufSize> z85_secret{};
    if (zmq_curve_keypair(z85_public.data(), z85_secret.data()) != 0)
    {
        throw std::runtime_error("Failed to generate CurveZMQ key pair");
    }
    socket.set(zmq::sockopt::curve_serverkey, server_key);
    socket.set(zmq::sockopt::curve_publickey, std::string(z85_public.data(), kZ85KeyLen));
    socket.set(zmq::sockopt::curve_secretkey, std::string(z85_secret.data(), kZ85KeyLen));
}

/// Non-blocking control send. Returns false when the socket would block.
inline bool send_control(zmq::socket_t &socket, const std::string &msg_type,
                         const nlohmann::json &body)
{
    const std::string body_str = body.dump();
    std::array<zmq::const_buffer, 3> msgs = {zmq::buffer(&protocol::kFrameTypeControl, 1),
                                             zmq::buffer(msg_type), zmq::buffer(body_str)};
    return zmq::send_multipart(socket, msgs, zmq::send_flags::dontwait).has_value();
}

/// Non-blocking data send. Returns false when the socket would block.
inline bool send_data(zmq::socket_t &socket, const std::string &payload)
{
    std::array<zmq::const_buffer, 2> msgs = {zmq::buffer(&protocol::kFrameTypeData, 1),
                                             zmq::buffer(payload)};
    return zmq::send_multipart(socket, msgs, zmq::send_flags::dontwait).has_value();
}

/// One decoded inbound frame set.
struct Inbound
{
    char kind{0};          ///< kFrameTypeControl or kFrameTypeData
    std::string msg_type;  ///< control only
    std::string body;      ///< control JSON text, or the data payload
};

/**
 * @brief Receive one multipart message without blocking.
 * @return std::nullopt when nothing is queued; an Inbound with kind 0 when malformed.
 */
inline std::optional<Inbound> recv_inbound(zmq::socket_t &socket)
{
    std::vector<zmq::message_t> frames;
    if (!zmq::recv_multipart(socket, std::back_inserter(frames), zmq::recv_flags::dontwait))
    {
        return std::nullopt;
    }
    Inbound in;
    if (frames.empty() || frames[0].size() != 1)
    {
        return in;
    }
    const char kind = *static_cast<const char *>(frames[0].data());
    if (kind == protocol::kFrameTypeControl && frames.size() >= 3)
    {
        in.kind = kind;
        in.msg_type = frames[1].to_string();
        in.body = frames[2].to_string();
    }
    else if (kind == protocol::kFrameTypeData && frames.size() >= 2)
    {
        in.kind = kind;
        in.body = frames[1].to_string();
    }
    return in;
}

} // namespace relayhub::client::detail
