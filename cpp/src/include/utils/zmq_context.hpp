#pragma once
/**
 * @file zmq_context.hpp
 * @brief Shared ZeroMQ context for client-side relay sockets.
 *
 * RelaySession and RelayExecutor create their DEALER sockets from this single
 * process-wide context. The broker owns a private context so that stopping it
 * never blocks on sockets it does not own.
 */
#include "relayhub_utils_export.h"

#include <zmq.hpp>

namespace relayhub::client
{

/**
 * @brief Returns the process-wide ZeroMQ context, creating it on first use.
 * @note The context is intentionally never terminated, so process exit never
 *       blocks on a socket that some thread still holds.
 */
[[nodiscard]] RELAYHUB_UTILS_EXPORT zmq::context_t &get_zmq_context();

} // namespace relayhub::client
