#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace net_survey::common
{
    // Canonical form is "XX:XX:XX:XX:XX:XX". Colon, hyphen, dot or no
    // separators are accepted, case-insensitive. Anything else is rejected.
    std::optional<std::string> NormalizeHardwareAddress(std::string_view text);

    // Manufacturer prefix "XX:XX:XX" of a full hardware address.
    std::optional<std::string> ManufacturerPrefix(std::string_view hardwareAddress);

    // Normalizes a bare prefix as found in a vendor directory row. Longer
    // inputs (a full address) are cut to their first three octets.
    std::optional<std::string> NormalizePrefix(std::string_view text);
}
