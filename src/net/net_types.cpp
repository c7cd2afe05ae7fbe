#include "net/net_types.hpp"

#include <charconv>

#include <fmt/format.h>

namespace simpub::net
{

void to_json(nlohmann::json &j, const ClientInfo &info)
{
    j = nlohmann::json{{"Host", info.host}, {"Topics", info.topics}};
}

void from_json(const nlohmann::json &j, ClientInfo &info)
{
    j.at("Host").get_to(info.host);
    j.at("Topics").get_to(info.topics);
}

void to_json(nlohmann::json &j, const RegistrySnapshot &snapshot)
{
    j = nlohmann::json{{"Topic", snapshot.topics}, {"Service", snapshot.services}};
}

void from_json(const nlohmann::json &j, RegistrySnapshot &snapshot)
{
    j.at("Topic").get_to(snapshot.topics);
    j.at("Service").get_to(snapshot.services);
}

std::string tcp_endpoint(const std::string &host, int port)
{
    if (port == 0)
    {
        return fmt::format("tcp://{}:*", host);
    }
    return fmt::format("tcp://{}:{}", host, port);
}

int endpoint_port(std::string_view endpoint) noexcept
{
    const auto pos = endpoint.rfind(':');
    if (pos == std::string_view::npos)
    {
        return -1;
    }
    const auto digits = endpoint.substr(pos + 1);
    int port = -1;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        return -1;
    }
    return port;
}

} // namespace simpub::net
