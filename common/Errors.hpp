#pragma once

#include <stdexcept>
#include <string>

namespace net_survey::common
{
    // Fatal conditions. Anything thrown from this hierarchy aborts the scan.
    class ScanError : public std::runtime_error
    {
    public:
        explicit ScanError(const std::string &what) : std::runtime_error(what) {}
    };

    class ConfigurationError : public ScanError
    {
    public:
        explicit ConfigurationError(const std::string &what) : ScanError(what) {}
    };

    class PermissionError : public ScanError
    {
    public:
        explicit PermissionError(const std::string &what) : ScanError(what) {}
    };
}
