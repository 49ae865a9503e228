#pragma once

/**
 * @file relay_config.hpp
 * @brief RelayConfig: settings of the relay broker process.
 *
 * ## Config loading: layered (priority low → high)
 *
 *  1. Built-in C++ defaults
 *  2. JSON file named by `--config <path>` or, failing that, `RELAYHUB_CONFIG_FILE`.
 *     Keys live under `"relay"`, `"logging"` and `"lock"`:
 *     @code
 *     {
 *       "relay":   {"host": "127.0.0.1", "port": 8888, "path": "/", "peer_timeout_s": 60,
 *                   "use_curve": false},
 *       "logging": {"level": "info", "file": ""},
 *       "lock":    {"dir": "", "reuse_existing": true}
 *     }
 *     @endcode
 *  3. Environment: `RELAY_HOST`, `RELAY_PORT`, `RELAY_PATH`
 *  4. Command line: `--host H`, `--port P` (or `-p P`), `--path /p`, the `--opt=value` forms,
 *     a bare numeric argument as the port, `--log-level`, `--log-file`,
 *     `--lock-dir`, `--curve`, `--no-reuse`, `-h/--help`
 *
 * Invalid values raise std::runtime_error naming the offending source.
 */

#include "relayhub_utils_export.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace relayhub::utils
{

struct RELAYHUB_UTILS_EXPORT RelayConfig
{
    std::string host{"127.0.0.1"};
    uint16_t port{8888};
    std::string path{"/"};
    std::chrono::seconds peer_timeout{60};
    bool use_curve{false};

    std::string log_level{"info"};
    /// Empty: log to stderr.
    std::string log_file;

    /// Empty: the system temp directory.
    std::string lock_dir;
    /// When another live relay holds the lock, exit successfully instead of failing.
    bool reuse_existing{true};

    bool show_help{false};
    /// File actually loaded in layer 2; empty when none.
    std::string config_file;

    /**
     * @brief Runs every layer. @p args excludes the program name.
     * @throws std::runtime_error on an unreadable config file, a bad value or an
     *         unknown argument.
     */
    static RelayConfig load(const std::vector<std::string> &args);
    static RelayConfig load(int argc, const char *const *argv);

    /// Merges a parsed config document over the current values.
    void apply_json(const nlohmann::json &doc);
    void apply_env();
    void apply_args(const std::vector<std::string> &args);

    /// Current values in the config-file layout.
    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Parses a TCP port in 1..65535.
     * @param source Named in the error message, e.g. "RELAY_PORT".
     * @throws std::runtime_error
     */
    static uint16_t parse_port(std::string_view value, std::string_view source);

    [[nodiscard]] static std::string usage(std::string_view program);
};

} // namespace relayhub::utils
