#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace net_survey::common
{
    inline constexpr std::uint32_t MAX_SWEEP_HOSTS = 65536;

    std::optional<std::uint32_t> ParseAddress(std::string_view text);
    std::string FormatAddress(std::uint32_t address);

    // Numeric ordering for dotted quads. Unparseable strings sort last.
    bool AddressLess(const std::string &lhs, const std::string &rhs);

    std::uint32_t PrefixToMask(int prefix);
    std::optional<int> MaskToPrefix(std::uint32_t mask);

    class Ipv4Network
    {
    public:
        Ipv4Network() = default;
        // Host bits are masked off.
        Ipv4Network(std::uint32_t address, int prefix);

        // Accepts "a.b.c.d/len", "a.b.c.d/m.m.m.m" or a bare address (/32).
        // Throws ConfigurationError on malformed input.
        static Ipv4Network Parse(std::string_view text);

        std::uint32_t Network() const { return m_network; }
        std::uint32_t Mask() const { return PrefixToMask(m_prefix); }
        std::uint32_t Broadcast() const { return m_network | ~Mask(); }
        int Prefix() const { return m_prefix; }

        bool Contains(std::uint32_t address) const;
        bool Contains(const std::string &address) const;

        std::uint64_t HostCount() const;
        // Usable hosts; network and broadcast are skipped below /31.
        std::vector<std::uint32_t> Hosts() const;

        std::string ToString() const;

        bool operator==(const Ipv4Network &other) const
        {
            return m_network == other.m_network && m_prefix == other.m_prefix;
        }

    private:
        std::uint32_t m_network = 0;
        int m_prefix = 32;
    };
}
