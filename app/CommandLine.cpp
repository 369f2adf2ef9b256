#include "CommandLine.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <cmath>
#include <cstdlib>

#ifndef NET_SURVEY_DEFAULT_OUI_DB
#define NET_SURVEY_DEFAULT_OUI_DB "oui_db.csv"
#endif

namespace net_survey::app
{
    namespace
    {
        constexpr double MIN_WINDOW_MS = 1.0;
        constexpr double MAX_WINDOW_MS = 3600.0 * 1000.0;

        bool ParseSeconds(const QString &text, std::chrono::milliseconds &out)
        {
            bool ok = false;
            double seconds = text.toDouble(&ok);
            if (!ok || !std::isfinite(seconds))
                return false;
            double millis = seconds * 1000.0;
            if (millis < MIN_WINDOW_MS || millis > MAX_WINDOW_MS)
                return false;
            out = std::chrono::milliseconds(static_cast<long long>(millis));
            return true;
        }
    }

    CliParseResult ParseCommandLine(const QStringList &arguments)
    {
        CliParseResult result;

        QCommandLineParser parser;
        parser.setApplicationDescription(QStringLiteral("ARP + ICMP local network inventory"));
        QCommandLineOption helpOption = parser.addHelpOption();
        QCommandLineOption versionOption = parser.addVersionOption();

        QCommandLineOption subnetOption(QStringList{"s", "subnet"}, "Subnet to sweep in CIDR form (default: autodetect).", "cidr");
        QCommandLineOption ifaceOption(QStringList{"i", "iface"}, "Network interface to probe from.", "name");
        QCommandLineOption noPingOption("no-ping", "Skip the ICMP liveness probe.");
        QCommandLineOption noMdnsOption("no-mdns", "Skip multicast DNS hostname lookups.");
        QCommandLineOption legacyDnsOption("legacy-dns", "Fall back to the system resolver for hostnames.");
        QCommandLineOption ouiOption("oui-db", "Vendor directory file (prefix,vendor).", "path");
        QCommandLineOption arpTimeoutOption("arp-timeout", "ARP reply window in seconds (default 2).", "seconds");
        QCommandLineOption pingTimeoutOption("ping-timeout", "Echo reply window in seconds (default 1).", "seconds");
        QCommandLineOption jsonOption(QStringList{"j", "json-output"}, "JSON output file.", "path", "devices.json");
        QCommandLineOption graphOption(QStringList{"g", "graph-output"}, "Topology PNG output file.", "path", "topology.png");
        QCommandLineOption noGraphOption("no-graph", "Do not render the topology diagram.");
        QCommandLineOption quietOption(QStringList{"q", "quiet"}, "Only print errors.");

        parser.addOptions({subnetOption, ifaceOption, noPingOption, noMdnsOption, legacyDnsOption, ouiOption,
                           arpTimeoutOption, pingTimeoutOption, jsonOption, graphOption, noGraphOption, quietOption});

        result.help_text = parser.helpText();

        if (!parser.parse(arguments))
        {
            result.error = parser.errorText().toStdString();
            return result;
        }

        if (parser.isSet(helpOption))
        {
            result.show_help = true;
            return result;
        }
        if (parser.isSet(versionOption))
        {
            result.show_version = true;
            return result;
        }

        if (!parser.positionalArguments().isEmpty())
        {
            result.error = "Unexpected argument: " + parser.positionalArguments().first().toStdString();
            return result;
        }

        CliOptions &opts = result.options;
        if (parser.isSet(subnetOption))
            opts.scan.subnet = parser.value(subnetOption).toStdString();
        if (parser.isSet(ifaceOption))
            opts.scan.interface_name = parser.value(ifaceOption).toStdString();
        opts.scan.enable_ping = !parser.isSet(noPingOption);
        opts.scan.enable_multicast_names = !parser.isSet(noMdnsOption);
        opts.scan.enable_legacy_resolver = parser.isSet(legacyDnsOption);

        if (parser.isSet(arpTimeoutOption) && !ParseSeconds(parser.value(arpTimeoutOption), opts.scan.timing.arp_window))
        {
            result.error = "Invalid --arp-timeout: " + parser.value(arpTimeoutOption).toStdString();
            return result;
        }
        if (parser.isSet(pingTimeoutOption) && !ParseSeconds(parser.value(pingTimeoutOption), opts.scan.timing.echo_timeout))
        {
            result.error = "Invalid --ping-timeout: " + parser.value(pingTimeoutOption).toStdString();
            return result;
        }

        if (parser.isSet(ouiOption))
            opts.oui_db = parser.value(ouiOption).toStdString();

        opts.json_output = parser.value(jsonOption).toStdString();
        if (parser.isSet(noGraphOption))
            opts.graph_output.reset();
        else
            opts.graph_output = parser.value(graphOption).toStdString();

        opts.quiet = parser.isSet(quietOption);
        return result;
    }

    std::string ResolveVendorDirectoryPath(const std::optional<std::string> &flag)
    {
        if (flag)
            return *flag;
        if (const char *env = std::getenv(OUI_DB_ENV); env && *env)
            return env;
        return NET_SURVEY_DEFAULT_OUI_DB;
    }
}
