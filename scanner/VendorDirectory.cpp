#include "VendorDirectory.hpp"
#include "../common/HardwareAddress.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <vector>

namespace net_survey::scanner
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c)
                                          { return std::isspace(c); });
            auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c)
                                        { return std::isspace(c); })
                           .base();
            return begin < end ? std::string(begin, end) : std::string();
        }

        // Comma-separated fields; double quotes group commas and "" escapes a quote.
        std::vector<std::string> SplitRow(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string current;
            bool quoted = false;

            for (std::size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];
                if (quoted)
                {
                    if (c == '"' && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        current.push_back('"');
                        ++i;
                    }
                    else if (c == '"')
                        quoted = false;
                    else
                        current.push_back(c);
                }
                else if (c == '"')
                    quoted = true;
                else if (c == ',')
                {
                    fields.push_back(Trim(current));
                    current.clear();
                }
                else
                    current.push_back(c);
            }
            fields.push_back(Trim(current));
            return fields;
        }

        bool IsHeader(const std::string &field)
        {
            std::string lower;
            for (char c : field)
                lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            return lower == "prefix";
        }
    }

    VendorDirectory VendorDirectory::LoadFromFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            std::cerr << "[Vendors] Directory " << path << " not readable, vendor names disabled\n";
            return VendorDirectory();
        }

        VendorDirectory directory = LoadFromStream(file);
        std::cout << "[Vendors] Loaded " << directory.Size() << " prefixes from " << path << "\n";
        return directory;
    }

    VendorDirectory VendorDirectory::LoadFromStream(std::istream &in)
    {
        VendorDirectory directory;
        std::string line;

        while (std::getline(in, line))
        {
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            std::string trimmed = Trim(line);
            if (trimmed.empty() || trimmed.front() == '#')
                continue;

            auto fields = SplitRow(trimmed);
            if (fields.size() < 2 || IsHeader(fields[0]))
                continue;

            auto prefix = common::NormalizePrefix(fields[0]);
            if (!prefix || fields[1].empty())
                continue;

            directory.m_vendors[*prefix] = fields[1];
        }
        return directory;
    }

    std::optional<std::string> VendorDirectory::Lookup(const std::string &hardware_address) const
    {
        auto prefix = common::ManufacturerPrefix(hardware_address);
        if (!prefix)
            return std::nullopt;

        auto it = m_vendors.find(*prefix);
        if (it == m_vendors.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<std::string> VendorDirectory::LookupPrefix(const std::string &prefix) const
    {
        auto normalized = common::NormalizePrefix(prefix);
        if (!normalized)
            return std::nullopt;

        auto it = m_vendors.find(*normalized);
        if (it == m_vendors.end())
            return std::nullopt;
        return it->second;
    }
}
