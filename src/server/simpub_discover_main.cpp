/**
 * @file simpub_discover_main.cpp
 * @brief simpub-discover: consumer-side discovery probe.
 *
 * Usage:
 *   simpub-discover [timeout_ms] [--port N] [--service-port N]
 *                   [--register HOST TOPIC...]
 *
 * Waits for one discovery announcement and prints the sender and its registry
 * as JSON. With --register it then calls the producer's "Register" service with
 * the given host and topics and prints the reply.
 *
 * Exit status: 0 on success, 1 on bad arguments or socket errors, 2 if no
 * announcement arrived in time, 3 if the registration got no reply.
 */
#include "net/discovery.hpp"
#include "net/net_error.hpp"
#include "net/net_types.hpp"
#include "net/service_channel.hpp"

#include "utils/logger.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace simpub;

namespace
{
constexpr int kNoAnnouncement = 2;
constexpr int kNoReply = 3;

struct Options
{
    std::chrono::milliseconds timeout{5000};
    int discovery_port{net::kDefaultDiscoveryPort};
    int service_port{net::kDefaultServicePort};
    std::optional<net::ClientInfo> registration;
};

std::optional<int> parse_int(std::string_view text)
{
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return std::nullopt;
    }
    return value;
}

std::optional<Options> parse_args(int argc, char *argv[])
{
    Options opts;
    std::vector<std::string_view> args(argv + 1, argv + argc); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    for (size_t i = 0; i < args.size(); ++i)
    {
        const auto arg = args[i];
        if ((arg == "--port" || arg == "--service-port") && i + 1 < args.size())
        {
            auto value = parse_int(args[++i]);
            if (!value)
            {
                return std::nullopt;
            }
            (arg == "--port" ? opts.discovery_port : opts.service_port) = *value;
        }
        else if (arg == "--register" && i + 1 < args.size())
        {
            net::ClientInfo info;
            info.host = std::string(args[++i]);
            while (i + 1 < args.size())
            {
                info.topics.emplace_back(args[++i]);
            }
            opts.registration = std::move(info);
        }
        else if (auto ms = parse_int(arg); ms && *ms > 0)
        {
            opts.timeout = std::chrono::milliseconds{*ms};
        }
        else
        {
            return std::nullopt;
        }
    }
    return opts;
}
} // namespace

int main(int argc, char *argv[])
{
    auto opts = parse_args(argc, argv);
    if (!opts)
    {
        fmt::print(stderr, "usage: simpub-discover [timeout_ms] [--port N] [--service-port N] "
                           "[--register HOST TOPIC...]\n");
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_SUCCESS;
    try
    {
        net::DiscoveryListener listener(opts->discovery_port);
        LOGGER_INFO("simpub-discover: listening on UDP port {} for {} ms", listener.port(),
                    opts->timeout.count());

        auto announcement = listener.wait_for_announcement(opts->timeout);
        if (!announcement)
        {
            LOGGER_WARN("simpub-discover: no announcement within {} ms", opts->timeout.count());
            exit_code = kNoAnnouncement;
        }
        else
        {
            const nlohmann::json out{{"sender", announcement->sender},
                                     {"registry", announcement->registry}};
            fmt::print("{}\n", out.dump(2));

            if (opts->registration)
            {
                zmq::context_t context(1);
                net::ServiceClient client(
                    context, net::tcp_endpoint(announcement->sender, opts->service_port));
                const nlohmann::json body = *opts->registration;
                auto reply = client.request(net::kRegisterService, body.dump(), opts->timeout);
                if (reply)
                {
                    fmt::print("{}\n", *reply);
                }
                else
                {
                    LOGGER_WARN("simpub-discover: no reply from {}", client.endpoint());
                    exit_code = kNoReply;
                }
            }
        }
    }
    catch (const net::NetError &e)
    {
        LOGGER_ERROR("simpub-discover: {}", e.what());
        exit_code = EXIT_FAILURE;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("simpub-discover: fatal: {}", e.what());
        exit_code = EXIT_FAILURE;
    }

    utils::Logger::instance().shutdown();
    return exit_code;
}
