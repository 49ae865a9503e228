#include "utils/relay_error.hpp"

namespace relayhub::client
{

const char *to_string(RelayErrc code) noexcept
{
    switch (code)
    {
    case RelayErrc::InvalidArgument:      return "InvalidArgument";
    case RelayErrc::NotConnected:         return "NotConnected";
    case RelayErrc::ExecutorNotConnected: return "ExecutorNotConnected";
    case RelayErrc::RelayUnreachable:     return "RelayUnreachable";
    case RelayErrc::Rejected:             return "Rejected";
    case RelayErrc::RequestTimeout:       return "RequestTimeout";
    case RelayErrc::TooManyPending:       return "TooManyPending";
    case RelayErrc::Disconnected:         return "Disconnected";
    case RelayErrc::KeepaliveTimeout:     return "KeepaliveTimeout";
    case RelayErrc::ExecutorDisconnected: return "ExecutorDisconnected";
    case RelayErrc::BrokerError:          return "BrokerError";
    case RelayErrc::RemoteError:          return "RemoteError";
    case RelayErrc::WriteFailed:          return "WriteFailed";
    }
    return "Unknown";
}

const char *error_code_string(RelayErrc code) noexcept
{
    switch (code)
    {
    case RelayErrc::NotConnected:
    case RelayErrc::ExecutorNotConnected:
    case RelayErrc::RelayUnreachable:
    case RelayErrc::Rejected:
    case RelayErrc::Disconnected:
    case RelayErrc::KeepaliveTimeout:
    case RelayErrc::ExecutorDisconnected:
        return "E_NOT_CONNECTED";
    case RelayErrc::RequestTimeout:
    case RelayErrc::TooManyPending:
        return "E_TIMEOUT";
    case RelayErrc::RemoteError:
    case RelayErrc::BrokerError:
        return "E_REMOTE";
    case RelayErrc::InvalidArgument:
        return "E_INVALID_INPUT";
    case RelayErrc::WriteFailed:
        return "E_INTERNAL";
    }
    return "E_INTERNAL";
}

} // namespace relayhub::client
