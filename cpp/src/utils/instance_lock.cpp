#include "rh_platform.hpp"
#include "utils/instance_lock.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <fstream>

#if defined(RELAYHUB_IS_POSIX)
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace relayhub::utils
{

namespace
{
constexpr int kLockFileMode = 0644;
constexpr std::string_view kLockFilePrefix = "relayhub-relay-";
constexpr std::string_view kLockFileSuffix = ".lock.json";

std::string safe_host(std::string_view host)
{
    std::string out(host);
    for (auto &c : out)
    {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '.' || c == '-';
        if (!ok)
        {
            c = '_';
        }
    }
    return out;
}

#if defined(RELAYHUB_IS_POSIX)
bool write_all(int fd, const std::string &content)
{
    const char *p = content.data();
    size_t left = content.size();
    while (left > 0)
    {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

/// O_EXCL create-and-write. A reader may briefly observe a partial record.
bool create_with_excl(const fs::path &target, const std::string &content, std::error_code &ec)
{
    const int fd = ::open(target.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, kLockFileMode);
    if (fd == -1)
    {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    const bool ok = write_all(fd, content);
    const int err = errno;
    ::close(fd);
    if (!ok)
    {
        ::unlink(target.c_str());
        ec = std::error_code(err, std::generic_category());
        return false;
    }
    return true;
}
#endif

/**
 * Creates @p target holding @p content, failing with errc::file_exists if it is
 * already there. On POSIX the record is written to a private temp file first and
 * published with link(), so it never appears half-written.
 */
bool create_exclusive(const fs::path &target, const std::string &content, std::error_code &ec)
{
#if defined(RELAYHUB_IS_POSIX)
    fs::path tmp = target;
    tmp += fmt::format(".{}.tmp", platform::get_pid());
    const int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, kLockFileMode);
    if (fd == -1)
    {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    const bool written = write_all(fd, content);
    const int write_err = errno;
    ::close(fd);
    if (!written)
    {
        ::unlink(tmp.c_str());
        ec = std::error_code(write_err, std::generic_category());
        return false;
    }

    const int rc = ::link(tmp.c_str(), target.c_str());
    const int link_err = errno;
    ::unlink(tmp.c_str());
    if (rc == 0)
    {
        return true;
    }
    if (link_err == EPERM || link_err == ENOTSUP || link_err == EOPNOTSUPP)
    {
        // Filesystem without hard links.
        return create_with_excl(target, content, ec);
    }
    ec = std::error_code(link_err, std::generic_category());
    return false;
#else
    // "x": exclusive create (fails with EEXIST).
    std::FILE *f = std::fopen(target.string().c_str(), "wx");
    if (f == nullptr)
    {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    const bool ok = std::fwrite(content.data(), 1, content.size(), f) == content.size();
    const bool closed = std::fclose(f) == 0;
    if (!ok || !closed)
    {
        std::error_code ignored;
        fs::remove(target, ignored);
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    return true;
#endif
}
} // namespace

InstanceLock::InstanceLock(std::string host, uint16_t port, fs::path lock_dir)
    : m_host(std::move(host)), m_port(port), m_path(lock_path_for(m_host, port, lock_dir))
{
}

InstanceLock::~InstanceLock()
{
    release();
}

InstanceLock::InstanceLock(InstanceLock &&other) noexcept
    : m_host(std::move(other.m_host)), m_port(other.m_port), m_path(std::move(other.m_path)),
      m_owned(other.m_owned)
{
    other.m_owned = false;
}

InstanceLock &InstanceLock::operator=(InstanceLock &&other) noexcept
{
    if (this != &other)
    {
        release();
        m_host = std::move(other.m_host);
        m_port = other.m_port;
        m_path = std::move(other.m_path);
        m_owned = other.m_owned;
        other.m_owned = false;
    }
    return *this;
}

fs::path InstanceLock::lock_path_for(std::string_view host, uint16_t port,
                                     const fs::path &lock_dir)
{
    const fs::path dir = lock_dir.empty() ? fs::temp_directory_path() : lock_dir;
    return dir / fmt::format("{}{}-{}{}", kLockFilePrefix, safe_host(host), port, kLockFileSuffix);
}

std::optional<uint64_t> InstanceLock::read_owner_pid(const fs::path &path) noexcept
{
    try
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            return std::nullopt;
        }
        const nlohmann::json j = nlohmann::json::parse(in);
        const auto it = j.find("pid");
        if (it == j.end() || !it->is_number_unsigned())
        {
            return std::nullopt;
        }
        return it->get<uint64_t>();
    }
    catch (const std::exception &e)
    {
        // Unparseable record: treated as having no live owner.
        LOGGER_DEBUG("InstanceLock: unreadable record {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

InstanceLockInfo InstanceLock::acquire() noexcept
{
    InstanceLockInfo info;
    info.lock_path = m_path;

    try
    {
        const uint64_t self = platform::get_pid();
        if (m_owned)
        {
            info.acquired = true;
            info.owner_pid = self;
            return info;
        }

        nlohmann::json record;
        record["pid"] = self;
        record["host"] = m_host;
        record["port"] = m_port;
        record["createdAt"] = format_tools::iso8601_utc(std::chrono::system_clock::now());
        const std::string content = record.dump(2);

        for (int attempt = 0; attempt < 2; ++attempt)
        {
            std::error_code ec;
            if (create_exclusive(m_path, content, ec))
            {
                m_owned = true;
                info.acquired = true;
                info.owner_pid = self;
                LOGGER_INFO("InstanceLock: acquired {} (pid {})", m_path.string(), self);
                return info;
            }
            if (ec != std::errc::file_exists)
            {
                LOGGER_ERROR("InstanceLock: cannot create {}: {}", m_path.string(), ec.message());
                info.error = ec;
                return info;
            }

            const auto owner = read_owner_pid(m_path);
            if (owner.has_value() && platform::is_process_alive(*owner))
            {
                LOGGER_INFO("InstanceLock: {} is held by live pid {}", m_path.string(), *owner);
                info.owner_pid = owner;
                return info;
            }
            if (attempt == 0)
            {
                LOGGER_WARN("InstanceLock: reclaiming stale lock {} (pid {})", m_path.string(),
                            owner.has_value() ? std::to_string(*owner) : std::string("unknown"));
                std::error_code rm_ec;
                fs::remove(m_path, rm_ec);
                if (rm_ec)
                {
                    LOGGER_ERROR("InstanceLock: cannot remove stale {}: {}", m_path.string(),
                                 rm_ec.message());
                    info.error = rm_ec;
                    return info;
                }
            }
        }

        // Another process re-created the record between our removal and retry.
        info.owner_pid = read_owner_pid(m_path);
        return info;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("InstanceLock: acquire of {} failed: {}", m_path.string(), e.what());
        info.error = std::make_error_code(std::errc::io_error);
        return info;
    }
}

void InstanceLock::release() noexcept
{
    if (!m_owned)
    {
        return;
    }
    m_owned = false;
    try
    {
        const auto owner = read_owner_pid(m_path);
        if (owner.has_value() && *owner != platform::get_pid())
        {
            LOGGER_WARN("InstanceLock: {} now belongs to pid {}; left in place", m_path.string(),
                        *owner);
            return;
        }
        std::error_code ec;
        fs::remove(m_path, ec);
        if (ec)
        {
            LOGGER_WARN("InstanceLock: cannot remove {}: {}", m_path.string(), ec.message());
            return;
        }
        LOGGER_INFO("InstanceLock: released {}", m_path.string());
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("InstanceLock: release of {} failed: {}", m_path.string(), e.what());
    }
}

} // namespace relayhub::utils
