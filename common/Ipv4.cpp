#include "Ipv4.hpp"
#include "Errors.hpp"

#include <arpa/inet.h>
#include <cctype>

namespace net_survey::common
{
    std::optional<std::uint32_t> ParseAddress(std::string_view text)
    {
        std::string copy(text);
        in_addr addr{};
        if (inet_pton(AF_INET, copy.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatAddress(std::uint32_t address)
    {
        in_addr addr{};
        addr.s_addr = htonl(address);
        char buffer[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr, buffer, sizeof(buffer));
        return std::string(buffer);
    }

    bool AddressLess(const std::string &lhs, const std::string &rhs)
    {
        auto a = ParseAddress(lhs);
        auto b = ParseAddress(rhs);
        if (a && b)
            return *a < *b;
        if (a != b)
            return a.has_value();
        return lhs < rhs;
    }

    std::uint32_t PrefixToMask(int prefix)
    {
        if (prefix <= 0)
            return 0;
        if (prefix >= 32)
            return 0xFFFFFFFFu;
        return 0xFFFFFFFFu << (32 - prefix);
    }

    std::optional<int> MaskToPrefix(std::uint32_t mask)
    {
        int prefix = 0;
        while (prefix < 32 && (mask & (0x80000000u >> prefix)))
            ++prefix;
        if (PrefixToMask(prefix) != mask)
            return std::nullopt;
        return prefix;
    }

    Ipv4Network::Ipv4Network(std::uint32_t address, int prefix)
        : m_network(address & PrefixToMask(prefix)), m_prefix(prefix)
    {
    }

    Ipv4Network Ipv4Network::Parse(std::string_view text)
    {
        std::string trimmed(text);
        while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back())))
            trimmed.pop_back();
        while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.front())))
            trimmed.erase(trimmed.begin());

        auto slash = trimmed.find('/');
        auto address = ParseAddress(trimmed.substr(0, slash));
        if (!address)
            throw ConfigurationError("Invalid subnet '" + trimmed + "': bad address");

        if (slash == std::string::npos)
            return Ipv4Network(*address, 32);

        std::string suffix = trimmed.substr(slash + 1);
        if (suffix.empty())
            throw ConfigurationError("Invalid subnet '" + trimmed + "': missing prefix length");

        if (suffix.find('.') != std::string::npos)
        {
            auto mask = ParseAddress(suffix);
            auto prefix = mask ? MaskToPrefix(*mask) : std::nullopt;
            if (!prefix)
                throw ConfigurationError("Invalid subnet '" + trimmed + "': bad netmask");
            return Ipv4Network(*address, *prefix);
        }

        for (char c : suffix)
        {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                throw ConfigurationError("Invalid subnet '" + trimmed + "': bad prefix length");
        }
        if (suffix.size() > 2)
            throw ConfigurationError("Invalid subnet '" + trimmed + "': prefix length out of range");
        int prefix = std::stoi(suffix);
        if (prefix > 32)
            throw ConfigurationError("Invalid subnet '" + trimmed + "': prefix length out of range");
        return Ipv4Network(*address, prefix);
    }

    bool Ipv4Network::Contains(std::uint32_t address) const
    {
        return (address & Mask()) == m_network;
    }

    bool Ipv4Network::Contains(const std::string &address) const
    {
        auto value = ParseAddress(address);
        return value && Contains(*value);
    }

    std::uint64_t Ipv4Network::HostCount() const
    {
        std::uint64_t total = std::uint64_t{1} << (32 - m_prefix);
        if (m_prefix < 31)
            total -= 2;
        return total;
    }

    std::vector<std::uint32_t> Ipv4Network::Hosts() const
    {
        std::vector<std::uint32_t> hosts;
        std::uint64_t first = m_network;
        std::uint64_t last = Broadcast();
        if (m_prefix < 31)
        {
            ++first;
            --last;
        }
        hosts.reserve(static_cast<std::size_t>(last - first + 1));
        for (std::uint64_t a = first; a <= last; ++a)
            hosts.push_back(static_cast<std::uint32_t>(a));
        return hosts;
    }

    std::string Ipv4Network::ToString() const
    {
        return FormatAddress(m_network) + "/" + std::to_string(m_prefix);
    }
}
