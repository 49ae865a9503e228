#pragma once
/**
 * @file rh_base.hpp
 * @brief Layer 1: Basic modules built on rh_platform.
 *
 * Provides fmt and format_tools (timestamps, key/value string parsing).
 * Include this when you only need formatting helpers.
 */
#include "rh_platform.hpp"

#include <cstdint>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
