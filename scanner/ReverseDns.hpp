#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net_survey::scanner
{
    inline constexpr const char *MDNS_GROUP = "224.0.0.251";
    inline constexpr std::uint16_t MDNS_PORT = 5353;

    // "192.168.1.30" -> "30.1.168.192.in-addr.arpa". nullopt for non-IPv4 input.
    std::optional<std::string> ReverseName(const std::string &ip);

    std::vector<std::uint8_t> BuildPtrQuery(const std::string &reverse_name, std::uint16_t id);

    // Target of the first answer when it is a PTR record, root label removed.
    // Responses with another id, or that do not parse (including bad name
    // compression pointers), yield nullopt.
    std::optional<std::string> ParsePtrAnswer(const std::uint8_t *data, std::size_t size, std::uint16_t expected_id);

    std::string StripRootLabel(std::string name);
}
