#pragma once
/**
 * @file instance_lock.hpp
 * @brief Cross-process guard that keeps a second relay from binding the same host:port.
 *
 * The guard is a JSON record file created exclusively in a shared directory:
 *
 *   <dir>/relayhub-relay-<safe_host>-<port>.lock.json
 *   {"pid": 4242, "host": "127.0.0.1", "port": 8888, "createdAt": "2026-01-01T00:00:00.000Z"}
 *
 * acquire() never throws; it reports the outcome in an InstanceLockInfo so a caller
 * can fall back to reusing the relay that already runs instead of failing. A record
 * whose pid is no longer alive is stale and is reclaimed (once per acquire()).
 *
 * Unlike FileLock-style advisory locks, the record survives a crash of its owner;
 * the pid liveness check is what makes the record recoverable.
 */
#include "relayhub_utils_export.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace relayhub::utils
{

struct InstanceLockInfo
{
    bool acquired{false};
    std::filesystem::path lock_path;
    /// Pid recorded in the lock file: ours when acquired, the live owner's otherwise.
    std::optional<uint64_t> owner_pid;
    /// Set when the record could not be created for a reason other than contention.
    std::error_code error;
};

class RELAYHUB_UTILS_EXPORT InstanceLock
{
  public:
    /**
     * @param lock_dir Directory for the record; the system temp directory when empty.
     * @throws std::filesystem::filesystem_error if the temp directory cannot be resolved.
     */
    InstanceLock(std::string host, uint16_t port, std::filesystem::path lock_dir = {});

    /// Releases the record if this instance owns it.
    ~InstanceLock();

    InstanceLock(const InstanceLock &) = delete;
    InstanceLock &operator=(const InstanceLock &) = delete;
    InstanceLock(InstanceLock &&other) noexcept;
    InstanceLock &operator=(InstanceLock &&other) noexcept;

    /**
     * @brief Try to create the record.
     *
     * On contention the recorded owner pid is checked: a live owner yields
     * `acquired == false` with `owner_pid` set; a dead owner's record is deleted and
     * creation is retried once.
     */
    [[nodiscard]] InstanceLockInfo acquire() noexcept;

    /**
     * @brief Delete the record. A no-op unless this instance created it, and the
     *        record is left alone if it now names another process.
     */
    void release() noexcept;

    [[nodiscard]] bool owns() const noexcept { return m_owned; }
    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

    [[nodiscard]] static std::filesystem::path
    lock_path_for(std::string_view host, uint16_t port, const std::filesystem::path &lock_dir = {});

    /// Pid stored in the record at @p path; std::nullopt if missing or unreadable.
    [[nodiscard]] static std::optional<uint64_t>
    read_owner_pid(const std::filesystem::path &path) noexcept;

  private:
    std::string m_host;
    uint16_t m_port{0};
    std::filesystem::path m_path;
    bool m_owned{false};
};

} // namespace relayhub::utils
