#pragma once
/**
 * @file rh_relay.hpp
 * @brief Layer 3: The relay itself.
 *
 * Channel broker, caller session, executor endpoint, wire vocabulary, errors and
 * the broker process configuration. Include this to embed either side of a relay.
 */
#include "rh_service.hpp"

#include "utils/relay_broker.hpp"
#include "utils/relay_config.hpp"
#include "utils/relay_error.hpp"
#include "utils/relay_executor.hpp"
#include "utils/relay_protocol.hpp"
#include "utils/relay_session.hpp"
