#include "ReverseDns.hpp"
#include "../common/Ipv4.hpp"

#include <tins/tins.h>

namespace net_survey::scanner
{
    std::optional<std::string> ReverseName(const std::string &ip)
    {
        auto address = common::ParseAddress(ip);
        if (!address)
            return std::nullopt;

        std::string name;
        for (int shift = 0; shift < 32; shift += 8)
        {
            name += std::to_string((*address >> shift) & 0xFF);
            name += '.';
        }
        return name + "in-addr.arpa";
    }

    std::vector<std::uint8_t> BuildPtrQuery(const std::string &reverse_name, std::uint16_t id)
    {
        Tins::DNS dns;
        dns.id(id);
        dns.type(Tins::DNS::QUERY);
        dns.add_query(Tins::DNS::query(reverse_name, Tins::DNS::PTR, Tins::DNS::INTERNET));
        return dns.serialize();
    }

    std::optional<std::string> ParsePtrAnswer(const std::uint8_t *data, std::size_t size, std::uint16_t expected_id)
    {
        try
        {
            Tins::DNS dns(data, static_cast<std::uint32_t>(size));
            if (dns.type() != Tins::DNS::RESPONSE || dns.id() != expected_id)
                return std::nullopt;

            const auto answers = dns.answers();
            if (answers.empty())
                return std::nullopt;

            const auto &first = answers.front();
            if (first.query_type() != Tins::DNS::PTR)
                return std::nullopt;

            std::string name = StripRootLabel(first.data());
            if (name.empty())
                return std::nullopt;
            return name;
        }
        catch (const Tins::exception_base &)
        {
            return std::nullopt;
        }
    }

    std::string StripRootLabel(std::string name)
    {
        while (!name.empty() && name.back() == '.')
            name.pop_back();
        return name;
    }
}
