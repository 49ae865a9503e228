#include "rh_relay.hpp"

#include <csignal>
#include <cstdio>
#include <filesystem>

namespace
{
relayhub::broker::RelayBroker* g_broker = nullptr; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

void signal_handler(int /*sig*/)
{
    if (g_broker != nullptr)
    {
        g_broker->stop();
    }
}

void configure_logging(const relayhub::utils::RelayConfig& cfg)
{
    auto& logger = relayhub::utils::Logger::instance();
    if (const auto level = relayhub::utils::Logger::level_from_string(cfg.log_level))
    {
        logger.set_level(*level);
    }
    if (!cfg.log_file.empty())
    {
        logger.set_logfile(cfg.log_file);
    }
    logger.set_write_error_callback([](const std::string& err)
                                    { std::fprintf(stderr, "relayhub-broker: log write failed: %s\n", err.c_str()); });
}
} // namespace

int main(int argc, char* argv[])
{
    auto& logger = relayhub::utils::Logger::instance();

    relayhub::utils::RelayConfig cfg;
    try
    {
        cfg = relayhub::utils::RelayConfig::load(argc, argv);
    }
    catch (const std::runtime_error& e)
    {
        std::fprintf(stderr, "%s\n\n%s", e.what(),
                     relayhub::utils::RelayConfig::usage("relayhub-broker").c_str());
        return 2;
    }
    if (cfg.show_help)
    {
        std::fputs(relayhub::utils::RelayConfig::usage("relayhub-broker").c_str(), stdout);
        return 0;
    }
    configure_logging(cfg);
    if (!cfg.config_file.empty())
    {
        LOGGER_INFO("relayhub-broker: loaded config '{}'", cfg.config_file);
    }

    relayhub::utils::InstanceLock lock(cfg.host, cfg.port, std::filesystem::path(cfg.lock_dir));
    const auto info = lock.acquire();
    if (!info.acquired)
    {
        if (info.error)
        {
            LOGGER_ERROR("relayhub-broker: cannot take instance lock {}: {}",
                         info.lock_path.string(), info.error.message());
            logger.shutdown();
            return 1;
        }
        LOGGER_WARN("relayhub-broker: relay already running on {}:{} (pid {})", cfg.host, cfg.port,
                    info.owner_pid.value_or(0));
        logger.shutdown();
        return cfg.reuse_existing ? 0 : 1;
    }

    relayhub::broker::RelayBroker::Config bcfg;
    bcfg.host         = cfg.host;
    bcfg.port         = cfg.port;
    bcfg.path         = cfg.path;
    bcfg.peer_timeout = cfg.peer_timeout;
    bcfg.use_curve    = cfg.use_curve;

    int rc = 0;
    try
    {
        relayhub::broker::RelayBroker broker(bcfg);
        g_broker = &broker;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        LOGGER_INFO("relayhub-broker starting on {}:{} (path '{}')", cfg.host, cfg.port, cfg.path);
        broker.run();
        g_broker = nullptr;
    }
    catch (const std::runtime_error& e)
    {
        g_broker = nullptr;
        LOGGER_ERROR("relayhub-broker: {}", e.what());
        rc = 1;
    }

    lock.release();
    logger.shutdown();
    return rc;
}
