#include "utils/zmq_context.hpp"
#include "utils/logger.hpp"

namespace relayhub::client
{

zmq::context_t &get_zmq_context()
{
    static zmq::context_t *s_context = []
    {
        auto *ctx = new zmq::context_t(1); // NOLINT(cppcoreguidelines-owning-memory)
        LOGGER_INFO("ZMQContext: ZeroMQ context created.");
        return ctx;
    }();
    return *s_context;
}

} // namespace relayhub::client
