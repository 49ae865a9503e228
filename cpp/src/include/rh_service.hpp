#pragma once
/**
 * @file rh_service.hpp
 * @brief Layer 2: Service modules built on rh_base.
 *
 * Provides logging, libsodium-backed randomness, relay identifiers and the
 * cross-process instance lock. Include this when you need Logger, CryptoUtils,
 * uid generators or InstanceLock.
 */
#include "rh_base.hpp"

#include "utils/crypto_utils.hpp"
#include "utils/instance_lock.hpp"
#include "utils/logger.hpp"
#include "utils/uid_utils.hpp"
