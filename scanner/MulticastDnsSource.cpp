#include "MulticastDnsSource.hpp"

#include <arpa/inet.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <random>

namespace net_survey::scanner
{
    namespace
    {
        bool wait_readable(int fd, int timeout_ms)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;

            int r = poll(&pfd, 1, timeout_ms);
            return r > 0;
        }
    }

    int PollBudget(std::chrono::steady_clock::time_point deadline, std::chrono::steady_clock::time_point now)
    {
        if (now >= deadline)
            return 0;
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();
        if (remaining < 1)
            return 1;
        return static_cast<int>(remaining);
    }

    MulticastDnsSource::MulticastDnsSource(std::chrono::milliseconds timeout,
                                           const std::optional<std::string> &interface_name,
                                           const std::string &destination, std::uint16_t port)
        : m_sockfd(-1), m_timeout(timeout), m_destination(destination), m_port(port), m_nextId(0)
    {
        std::random_device rd;
        m_nextId = static_cast<std::uint16_t>(rd());

        m_sockfd = socket(AF_INET, SOCK_DGRAM, 0);
        if (m_sockfd < 0)
            return;

        unsigned char ttl = 255;
        setsockopt(m_sockfd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

        if (interface_name)
        {
            ip_mreqn mreq;
            std::memset(&mreq, 0, sizeof(mreq));
            mreq.imr_ifindex = static_cast<int>(if_nametoindex(interface_name->c_str()));
            if (mreq.imr_ifindex != 0)
                setsockopt(m_sockfd, IPPROTO_IP, IP_MULTICAST_IF, &mreq, sizeof(mreq));
        }
    }

    MulticastDnsSource::~MulticastDnsSource()
    {
        if (m_sockfd >= 0)
            close(m_sockfd);
    }

    std::optional<std::string> MulticastDnsSource::Lookup(const std::string &ip)
    {
        if (m_sockfd < 0)
            return std::nullopt;

        auto reverse = ReverseName(ip);
        if (!reverse)
            return std::nullopt;

        std::uint16_t id = m_nextId++;
        std::vector<std::uint8_t> query = BuildPtrQuery(*reverse, id);

        struct sockaddr_in group;
        std::memset(&group, 0, sizeof(group));
        group.sin_family = AF_INET;
        group.sin_port = htons(m_port);
        if (inet_pton(AF_INET, m_destination.c_str(), &group.sin_addr) != 1)
            return std::nullopt;

        if (sendto(m_sockfd, query.data(), query.size(), 0, (const struct sockaddr *)&group, sizeof(group)) < 0)
            return std::nullopt;

        auto deadline = std::chrono::steady_clock::now() + m_timeout;
        std::uint8_t buffer[9000];

        while (true)
        {
            int budget = PollBudget(deadline, std::chrono::steady_clock::now());
            if (budget == 0)
                return std::nullopt;
            if (!wait_readable(m_sockfd, budget))
                continue;

            ssize_t n = recvfrom(m_sockfd, buffer, sizeof(buffer), MSG_DONTWAIT, nullptr, nullptr);
            if (n < 0)
            {
                if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                    continue;
                return std::nullopt;
            }

            // Late replies to an earlier query carry a different id.
            auto name = ParsePtrAnswer(buffer, static_cast<std::size_t>(n), id);
            if (name)
                return name;
        }
    }
}
