#include "CommandLine.hpp"
#include "JsonExporter.hpp"
#include "TopologyRenderer.hpp"
#include "../common/Errors.hpp"
#include "../scanner/AddressSpaceResolver.hpp"
#include "../scanner/ArpSweeper.hpp"
#include "../scanner/IcmpPinger.hpp"
#include "../scanner/MulticastDnsSource.hpp"
#include "../scanner/NameResolver.hpp"
#include "../scanner/ScanOrchestrator.hpp"
#include "../scanner/SystemResolverSource.hpp"
#include "../scanner/VendorDirectory.hpp"

#include <QFileInfo>
#include <QGuiApplication>
#include <iostream>

#ifndef NET_SURVEY_VERSION
#define NET_SURVEY_VERSION "0.0.0"
#endif

namespace
{
    std::string AbsolutePath(const std::string &path)
    {
        return QFileInfo(QString::fromStdString(path)).absoluteFilePath().toStdString();
    }
}

int main(int argc, char *argv[])
{
    using namespace net_survey;

    // Rendering only needs fonts, never a display.
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
        qputenv("QT_QPA_PLATFORM", "offscreen");

    QGuiApplication qtApp(argc, argv);
    QCoreApplication::setApplicationName("net_survey");
    QCoreApplication::setApplicationVersion(NET_SURVEY_VERSION);

    app::CliParseResult cli = app::ParseCommandLine(QCoreApplication::arguments());
    if (!cli.error.empty())
    {
        std::cerr << "net_survey: " << cli.error << "\n\n" << cli.help_text.toStdString();
        return 2;
    }
    if (cli.show_help)
    {
        std::cout << cli.help_text.toStdString();
        return 0;
    }
    if (cli.show_version)
    {
        std::cout << "net_survey v" << NET_SURVEY_VERSION << "\n";
        return 0;
    }

    const app::CliOptions &opts = cli.options;
    if (opts.quiet)
        std::cout.setstate(std::ios::badbit);

    scanner::ScanResult result;
    try
    {
        scanner::VendorDirectory vendors = scanner::VendorDirectory::LoadFromFile(
            app::ResolveVendorDirectoryPath(opts.oui_db));

        scanner::SystemRouteTable routes;
        scanner::AddressSpaceResolver resolver(routes);
        scanner::ArpSweeper sweeper(opts.scan.timing.arp_window, opts.scan.timing.arp_spacing);
        scanner::IcmpPinger pinger(opts.scan.timing.echo_timeout, opts.scan.timing.echo_spacing);
        scanner::MulticastDnsSource mdns(opts.scan.timing.mdns_timeout, opts.scan.interface_name);
        scanner::SystemResolverSource legacy;
        scanner::NameResolver names(mdns, legacy);

        scanner::ScanOrchestrator orchestrator(resolver, sweeper, pinger, names, vendors);
        result = orchestrator.Run(opts.scan);
    }
    catch (const common::ScanError &e)
    {
        std::cerr << "[Scan] ERROR: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Scan] Unexpected failure: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[Scan] Scan complete. Found " << result.devices.size() << " devices.\n";

    try
    {
        app::SaveJson(result, opts.json_output);
        std::cout << "[Export] JSON saved: " << AbsolutePath(opts.json_output) << "\n";

        if (opts.graph_output)
        {
            app::RenderTopologyPng(result, *opts.graph_output);
            std::cout << "[Export] Topology PNG saved: " << AbsolutePath(*opts.graph_output) << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "[Export] ERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
