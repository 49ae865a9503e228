#include "utils/relay_config.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"
#include "utils/relay_protocol.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace relayhub::utils
{

namespace
{
constexpr uint32_t kMaxPort = 65535;

/// Recursively merges @p overrides into @p base (objects merge, everything else replaces).
void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

nlohmann::json read_config_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        throw std::runtime_error(fmt::format("RelayConfig: cannot open config file '{}'", path));
    }
    try
    {
        nlohmann::json j;
        f >> j;
        if (!j.is_object())
        {
            throw std::runtime_error(
                fmt::format("RelayConfig: '{}' must contain a JSON object", path));
        }
        return j;
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(
            fmt::format("RelayConfig: invalid JSON in '{}': {}", path, e.what()));
    }
}

std::optional<std::string> env_value(const char *name)
{
    const char *v = std::getenv(name);
    if (v == nullptr || *v == '\0')
        return std::nullopt;
    return std::string(v);
}

bool is_all_digits(std::string_view s)
{
    if (s.empty())
        return false;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

/// Splits "--key=value" into ("--key", "value"); a plain "--key" yields no value.
std::pair<std::string, std::optional<std::string>> split_option(const std::string &arg)
{
    const auto eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos)
    {
        return {arg.substr(0, eq), arg.substr(eq + 1)};
    }
    return {arg, std::nullopt};
}

/// Returns the --config argument, if any, without interpreting the others.
std::optional<std::string> find_config_arg(const std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        auto [key, value] = split_option(args[i]);
        if (key == "--config")
        {
            if (value.has_value())
                return value;
            if (i + 1 < args.size())
                return args[i + 1];
            throw std::runtime_error("RelayConfig: --config requires a value");
        }
    }
    return std::nullopt;
}
} // namespace

uint16_t RelayConfig::parse_port(std::string_view value, std::string_view source)
{
    const std::string_view trimmed = format_tools::trim_whitespace(value);
    uint32_t port = 0;
    const auto *first = trimmed.data();
    const auto *last = trimmed.data() + trimmed.size();
    const auto [ptr, ec] = std::from_chars(first, last, port);
    if (trimmed.empty() || ec != std::errc() || ptr != last || port < 1 || port > kMaxPort)
    {
        throw std::runtime_error(fmt::format(
            "RelayConfig: invalid port '{}' from {} (expected an integer in 1..{})", value,
            source, kMaxPort));
    }
    return static_cast<uint16_t>(port);
}

nlohmann::json RelayConfig::to_json() const
{
    nlohmann::json j;
    j["relay"]["host"]           = host;
    j["relay"]["port"]           = port;
    j["relay"]["path"]           = path;
    j["relay"]["peer_timeout_s"] = peer_timeout.count();
    j["relay"]["use_curve"]      = use_curve;
    j["logging"]["level"]        = log_level;
    j["logging"]["file"]         = log_file;
    j["lock"]["dir"]             = lock_dir;
    j["lock"]["reuse_existing"]  = reuse_existing;
    return j;
}

void RelayConfig::apply_json(const nlohmann::json &doc)
{
    nlohmann::json merged = to_json();
    json_merge(merged, doc);
    try
    {
        const auto &relay = merged.at("relay");
        host = relay.at("host").get<std::string>();
        const auto &jport = relay.at("port");
        if (jport.is_string())
        {
            port = parse_port(jport.get<std::string>(), "relay.port");
        }
        else
        {
            const auto p = jport.get<int64_t>();
            if (p < 1 || p > static_cast<int64_t>(kMaxPort))
            {
                throw std::runtime_error(fmt::format(
                    "RelayConfig: invalid port {} from relay.port (expected 1..{})", p, kMaxPort));
            }
            port = static_cast<uint16_t>(p);
        }
        path = protocol::normalize_path(relay.at("path").get<std::string>());
        const auto timeout_s = relay.at("peer_timeout_s").get<int64_t>();
        if (timeout_s < 0)
        {
            throw std::runtime_error("RelayConfig: relay.peer_timeout_s must not be negative");
        }
        peer_timeout = std::chrono::seconds(timeout_s);
        use_curve = relay.at("use_curve").get<bool>();

        const auto &logging = merged.at("logging");
        log_level = logging.at("level").get<std::string>();
        log_file = logging.at("file").get<std::string>();

        const auto &lock = merged.at("lock");
        lock_dir = lock.at("dir").get<std::string>();
        reuse_existing = lock.at("reuse_existing").get<bool>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(fmt::format("RelayConfig: bad value in config: {}", e.what()));
    }

    if (!Logger::level_from_string(log_level).has_value())
    {
        throw std::runtime_error(
            fmt::format("RelayConfig: unknown logging.level '{}'", log_level));
    }
}

void RelayConfig::apply_env()
{
    if (auto v = env_value("RELAY_HOST"))
    {
        host = *v;
    }
    if (auto v = env_value("RELAY_PORT"))
    {
        port = parse_port(*v, "RELAY_PORT");
    }
    if (auto v = env_value("RELAY_PATH"))
    {
        path = protocol::normalize_path(*v);
    }
}

void RelayConfig::apply_args(const std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        const std::string &arg = args[i];
        const auto option = split_option(arg);
        const std::string &key = option.first;
        const std::optional<std::string> &inline_value = option.second;

        auto take_value = [&]() -> std::string
        {
            if (inline_value.has_value())
                return *inline_value;
            if (i + 1 >= args.size())
                throw std::runtime_error(fmt::format("RelayConfig: {} requires a value", key));
            return args[++i];
        };

        if (key == "-h" || key == "--help")
        {
            show_help = true;
        }
        else if (key == "--config")
        {
            static_cast<void>(take_value()); // consumed by load()
        }
        else if (key == "--host")
        {
            host = take_value();
        }
        else if (key == "-p" || key == "--port")
        {
            port = parse_port(take_value(), key);
        }
        else if (key == "--path")
        {
            path = protocol::normalize_path(take_value());
        }
        else if (key == "--log-level")
        {
            log_level = take_value();
            if (!Logger::level_from_string(log_level).has_value())
            {
                throw std::runtime_error(
                    fmt::format("RelayConfig: unknown --log-level '{}'", log_level));
            }
        }
        else if (key == "--log-file")
        {
            log_file = take_value();
        }
        else if (key == "--lock-dir")
        {
            lock_dir = take_value();
        }
        else if (key == "--curve")
        {
            use_curve = true;
        }
        else if (key == "--no-reuse")
        {
            reuse_existing = false;
        }
        else if (is_all_digits(arg))
        {
            port = parse_port(arg, "command line");
        }
        else
        {
            throw std::runtime_error(fmt::format("RelayConfig: unknown argument '{}'", arg));
        }
    }
}

RelayConfig RelayConfig::load(const std::vector<std::string> &args)
{
    RelayConfig cfg;

    std::optional<std::string> file = find_config_arg(args);
    if (!file.has_value())
    {
        file = env_value("RELAYHUB_CONFIG_FILE");
    }
    if (file.has_value())
    {
        cfg.apply_json(read_config_file(*file));
        cfg.config_file = *file;
    }

    cfg.apply_env();
    cfg.apply_args(args);
    return cfg;
}

RelayConfig RelayConfig::load(int argc, const char *const *argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }
    return load(args);
}

std::string RelayConfig::usage(std::string_view program)
{
    return fmt::format(
        "Usage: {} [options] [port]\n"
        "\n"
        "Options:\n"
        "  --host <host>        Bind address (default 127.0.0.1, env RELAY_HOST)\n"
        "  -p, --port <port>    Bind port 1..65535 (default 8888, env RELAY_PORT)\n"
        "  --path <path>        Mount path peers must declare (default /, env RELAY_PATH)\n"
        "  --config <file>      JSON config file (env RELAYHUB_CONFIG_FILE)\n"
        "  --log-level <level>  trace|debug|info|warn|error|system (default info)\n"
        "  --log-file <file>    Append logs to a file instead of stderr\n"
        "  --lock-dir <dir>     Directory for the instance lock (default: temp dir)\n"
        "  --curve              Enable CurveZMQ encryption\n"
        "  --no-reuse           Fail instead of exiting 0 when a relay already runs\n"
        "  -h, --help           Show this help\n",
        program);
}

} // namespace relayhub::utils
