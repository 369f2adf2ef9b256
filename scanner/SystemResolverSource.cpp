#include "SystemResolverSource.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cstring>

namespace net_survey::scanner
{
    std::optional<std::string> SystemResolverSource::Lookup(const std::string &ip)
    {
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return std::nullopt;

        char host[NI_MAXHOST];
        if (getnameinfo((const struct sockaddr *)&addr, sizeof(addr), host, sizeof(host), nullptr, 0, NI_NAMEREQD) != 0)
            return std::nullopt;

        std::string name(host);
        if (name.empty())
            return std::nullopt;
        return name;
    }
}
