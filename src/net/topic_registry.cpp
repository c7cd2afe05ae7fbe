#include "net/topic_registry.hpp"

#include <algorithm>

namespace simpub::net
{

TopicRegistration TopicRegistry::register_topic(const Topic &topic, const IPAddress &host)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    TopicRegistration result;
    auto host_it = m_host_topics.find(host);
    result.host_already_registered =
        host_it != m_host_topics.end() && !host_it->second.empty();

    auto topic_it = m_topic_host.find(topic);
    if (topic_it != m_topic_host.end() && topic_it->second != host)
    {
        // Ownership moves: drop the topic from the old owner's list.
        result.previous_owner = topic_it->second;
        auto &old_list = m_host_topics[topic_it->second];
        old_list.erase(std::remove(old_list.begin(), old_list.end(), topic), old_list.end());
    }
    m_topic_host[topic] = host;

    auto &list = m_host_topics[host];
    if (std::find(list.begin(), list.end(), topic) == list.end())
    {
        list.push_back(topic);
    }
    return result;
}

bool TopicRegistry::register_service(const std::string &name, const IPAddress &host)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto [it, inserted] = m_service_host.insert_or_assign(name, host);
    return !inserted;
}

std::optional<IPAddress> TopicRegistry::topic_owner(const Topic &topic) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto pos = m_topic_host.find(topic);
    if (pos == m_topic_host.end())
    {
        return std::nullopt;
    }
    return pos->second;
}

std::optional<IPAddress> TopicRegistry::service_owner(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto pos = m_service_host.find(name);
    if (pos == m_service_host.end())
    {
        return std::nullopt;
    }
    return pos->second;
}

bool TopicRegistry::has_service(const std::string &name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_service_host.find(name) != m_service_host.end();
}

std::vector<Topic> TopicRegistry::host_topics(const IPAddress &host) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto pos = m_host_topics.find(host);
    if (pos == m_host_topics.end())
    {
        return {};
    }
    return pos->second;
}

bool TopicRegistry::has_host(const IPAddress &host) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_host_topics.find(host) != m_host_topics.end();
}

RegistrySnapshot TopicRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    RegistrySnapshot snap;
    snap.topics.insert(m_topic_host.begin(), m_topic_host.end());
    snap.services.insert(m_service_host.begin(), m_service_host.end());
    return snap;
}

size_t TopicRegistry::topic_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_topic_host.size();
}

size_t TopicRegistry::service_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_service_host.size();
}

} // namespace simpub::net
