#pragma once
/**
 * @file channel_registry.hpp
 * @brief In-memory channel membership table for the relay broker.
 *
 * A channel pairs at most one executor identity with any number of caller
 * identities. A channel with neither is garbage and must be removed by the
 * broker right after the membership change that emptied it (cleanup_if_empty()).
 *
 * Single-threaded access only: all methods are called from the RelayBroker run()
 * thread, or under its query mutex.
 *
 * This is a private implementation header, not part of the installed public API.
 */
#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace relayhub::broker
{

struct ChannelEntry
{
    /// ZMQ ROUTER identity of the executor; empty when no executor is attached.
    std::string executor_identity;
    /// Session id the executor declared in its HELLO; may be empty.
    std::string executor_session_id;
    /// ROUTER identities of joined callers.
    std::set<std::string> callers;
    std::chrono::steady_clock::time_point created_at{std::chrono::steady_clock::now()};

    [[nodiscard]] bool has_executor() const noexcept { return !executor_identity.empty(); }
    [[nodiscard]] bool empty() const noexcept { return executor_identity.empty() && callers.empty(); }
};

/**
 * @class ChannelRegistry
 * @brief Thread-unsafe map from channel id to ChannelEntry.
 */
class ChannelRegistry
{
public:
    /**
     * @brief Install @p identity as the channel's executor, creating the channel if needed.
     * @return The identity of the executor it replaced, or "" if the slot was free.
     *         The caller is responsible for closing the replaced peer.
     */
    std::string install_executor(const std::string& channel, const std::string& identity,
                                 const std::string& session_id);

    /**
     * @brief Clear the executor slot, but only if it is still held by @p identity.
     * @return false when the channel is unknown or another executor holds the slot
     *         (a late close from a replaced executor).
     */
    bool clear_executor(const std::string& channel, const std::string& identity);

    /// Add a caller, creating the channel if needed. Returns false if already present.
    bool add_caller(const std::string& channel, const std::string& identity);

    /// Remove a caller. Returns false if the channel or caller is unknown.
    bool remove_caller(const std::string& channel, const std::string& identity);

    /**
     * @brief Delete the channel if it has no executor and no callers.
     * @return true if the channel was removed.
     */
    bool cleanup_if_empty(const std::string& channel);

    [[nodiscard]] const ChannelEntry* find_channel(const std::string& channel) const noexcept;
    [[nodiscard]] bool has_channel(const std::string& channel) const noexcept;

    [[nodiscard]] std::vector<std::string> list_channels() const;
    [[nodiscard]] size_t size() const noexcept;

    /// Read-only access to every entry (for listing).
    [[nodiscard]] const std::unordered_map<std::string, ChannelEntry>& all_channels() const noexcept;

    void clear() noexcept;

private:
    std::unordered_map<std::string, ChannelEntry> m_channels;
};

} // namespace relayhub::broker
