#include "channel_registry.hpp"

namespace relayhub::broker
{

std::string ChannelRegistry::install_executor(const std::string& channel,
                                              const std::string& identity,
                                              const std::string& session_id)
{
    // operator[] creates the channel on first join; created_at defaults to now().
    ChannelEntry& entry = m_channels[channel];
    std::string previous = std::move(entry.executor_identity);
    if (previous == identity)
    {
        // Same peer re-declaring itself: nothing to replace.
        previous.clear();
    }
    entry.executor_identity   = identity;
    entry.executor_session_id = session_id;
    return previous;
}

bool ChannelRegistry::clear_executor(const std::string& channel, const std::string& identity)
{
    auto pos = m_channels.find(channel);
    if (pos == m_channels.end())
    {
        return false;
    }
    if (pos->second.executor_identity != identity)
    {
        return false;
    }
    pos->second.executor_identity.clear();
    pos->second.executor_session_id.clear();
    return true;
}

bool ChannelRegistry::add_caller(const std::string& channel, const std::string& identity)
{
    return m_channels[channel].callers.insert(identity).second;
}

bool ChannelRegistry::remove_caller(const std::string& channel, const std::string& identity)
{
    auto pos = m_channels.find(channel);
    if (pos == m_channels.end())
    {
        return false;
    }
    return pos->second.callers.erase(identity) > 0;
}

bool ChannelRegistry::cleanup_if_empty(const std::string& channel)
{
    auto pos = m_channels.find(channel);
    if (pos == m_channels.end() || !pos->second.empty())
    {
        return false;
    }
    m_channels.erase(pos);
    return true;
}

const ChannelEntry* ChannelRegistry::find_channel(const std::string& channel) const noexcept
{
    auto pos = m_channels.find(channel);
    return pos == m_channels.end() ? nullptr : &pos->second;
}

bool ChannelRegistry::has_channel(const std::string& channel) const noexcept
{
    return m_channels.find(channel) != m_channels.end();
}

std::vector<std::string> ChannelRegistry::list_channels() const
{
    std::vector<std::string> names;
    names.reserve(m_channels.size());
    for (const auto& [name, entry] : m_channels)
    {
        names.push_back(name);
    }
    return names;
}

size_t ChannelRegistry::size() const noexcept
{
    return m_channels.size();
}

const std::unordered_map<std::string, ChannelEntry>& ChannelRegistry::all_channels() const noexcept
{
    return m_channels;
}

void ChannelRegistry::clear() noexcept
{
    m_channels.clear();
}

} // namespace relayhub::broker
