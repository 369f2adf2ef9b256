#pragma once

#include <optional>
#include <string>
#include <QString>
#include <QStringList>
#include "../scanner/ScanOptions.hpp"

namespace net_survey::app
{
    inline constexpr const char *OUI_DB_ENV = "NET_SURVEY_OUI_DB";

    struct CliOptions
    {
        scanner::ScanOptions scan;
        std::string json_output = "devices.json";
        // Unset with --no-graph.
        std::optional<std::string> graph_output = std::string("topology.png");
        std::optional<std::string> oui_db;
        bool quiet = false;
    };

    struct CliParseResult
    {
        CliOptions options;
        bool show_help = false;
        bool show_version = false;
        // Non-empty on a usage error.
        std::string error;
        QString help_text;
    };

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    CliParseResult ParseCommandLine(const QStringList &arguments);

    // --oui-db, then $NET_SURVEY_OUI_DB, then the installed default.
    std::string ResolveVendorDirectoryPath(const std::optional<std::string> &flag);
}
