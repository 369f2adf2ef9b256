#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include "HostnameSource.hpp"
#include "ReverseDns.hpp"

namespace net_survey::scanner
{
    // Milliseconds to hand to poll() before the deadline; never below 1 so a
    // nearly expired window still waits instead of blocking indefinitely.
    int PollBudget(std::chrono::steady_clock::time_point deadline, std::chrono::steady_clock::time_point now);

    // Reverse lookup over multicast DNS: one PTR query to 224.0.0.251:5353
    // from an ephemeral port, answered by responders with a unicast reply.
    class MulticastDnsSource : public HostnameSource
    {
    public:
        MulticastDnsSource(std::chrono::milliseconds timeout, const std::optional<std::string> &interface_name,
                           const std::string &destination = MDNS_GROUP, std::uint16_t port = MDNS_PORT);
        ~MulticastDnsSource();

        MulticastDnsSource(const MulticastDnsSource &) = delete;
        MulticastDnsSource &operator=(const MulticastDnsSource &) = delete;

        std::optional<std::string> Lookup(const std::string &ip) override;

    private:
        int m_sockfd;
        std::chrono::milliseconds m_timeout;
        std::string m_destination;
        std::uint16_t m_port;
        std::uint16_t m_nextId;
    };
}
