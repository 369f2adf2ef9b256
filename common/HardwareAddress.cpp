#include "HardwareAddress.hpp"

#include <cctype>

namespace net_survey::common
{
    namespace
    {
        std::optional<std::string> HexDigits(std::string_view text)
        {
            std::string digits;
            digits.reserve(text.size());
            for (char c : text)
            {
                unsigned char uc = static_cast<unsigned char>(c);
                if (c == ':' || c == '-' || c == '.' || std::isspace(uc))
                    continue;
                if (!std::isxdigit(uc))
                    return std::nullopt;
                digits.push_back(static_cast<char>(std::toupper(uc)));
            }
            return digits;
        }

        std::string Colonize(const std::string &digits, std::size_t octets)
        {
            std::string out;
            for (std::size_t i = 0; i < octets; ++i)
            {
                if (i > 0)
                    out.push_back(':');
                out.append(digits, i * 2, 2);
            }
            return out;
        }
    }

    std::optional<std::string> NormalizeHardwareAddress(std::string_view text)
    {
        auto digits = HexDigits(text);
        if (!digits || digits->size() != 12)
            return std::nullopt;
        return Colonize(*digits, 6);
    }

    std::optional<std::string> ManufacturerPrefix(std::string_view hardwareAddress)
    {
        auto canonical = NormalizeHardwareAddress(hardwareAddress);
        if (!canonical)
            return std::nullopt;
        return canonical->substr(0, 8);
    }

    std::optional<std::string> NormalizePrefix(std::string_view text)
    {
        auto digits = HexDigits(text);
        if (!digits || digits->size() < 6 || digits->size() % 2 != 0)
            return std::nullopt;
        return Colonize(*digits, 3);
    }
}
