#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>

namespace net_survey::scanner
{
    // Manufacturer prefix -> vendor name, loaded once from a flat
    // "prefix,vendor" file and shared read-only for the rest of the run.
    class VendorDirectory
    {
    public:
        VendorDirectory() = default;

        // A missing or unreadable file yields an empty directory.
        static VendorDirectory LoadFromFile(const std::string &path);
        static VendorDirectory LoadFromStream(std::istream &in);

        std::optional<std::string> Lookup(const std::string &hardware_address) const;
        std::optional<std::string> LookupPrefix(const std::string &prefix) const;

        std::size_t Size() const { return m_vendors.size(); }
        bool Empty() const { return m_vendors.empty(); }

    private:
        std::unordered_map<std::string, std::string> m_vendors;
    };
}
