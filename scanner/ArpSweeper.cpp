#include "ArpSweeper.hpp"
#include "CaptureSession.hpp"
#include "../common/Errors.hpp"

#include <tins/tins.h>
#include <iostream>

namespace net_survey::scanner
{
    namespace
    {
        Tins::NetworkInterface PickInterface(const std::optional<std::string> &interface_name)
        {
            try
            {
                if (interface_name)
                    return Tins::NetworkInterface(*interface_name);
                return Tins::NetworkInterface::default_interface();
            }
            catch (const Tins::invalid_interface &)
            {
                throw common::ConfigurationError("Unknown network interface " + interface_name.value_or("(default)"));
            }
        }
    }

    ArpSweeper::ArpSweeper(std::chrono::milliseconds window, std::chrono::milliseconds spacing)
        : m_window(window), m_spacing(spacing)
    {
    }

    DiscoveryMap ArpSweeper::Sweep(const common::Ipv4Network &network,
                                   const std::optional<std::string> &interface_name)
    {
        if (network.HostCount() > common::MAX_SWEEP_HOSTS)
            throw common::ConfigurationError("Range " + network.ToString() + " is too large to sweep");

        Tins::NetworkInterface iface = PickInterface(interface_name);
        Tins::NetworkInterface::Info info = iface.info();

        // Opcode 2 (is-at) only; the kernel drops everything else.
        CaptureSession capture(iface.name(), "arp and arp[6:2] == 2");
        Tins::PacketSender sender;

        ArpReplyTable replies(network);
        auto onFrame = [&replies](const Tins::PDU &pdu)
        {
            const Tins::ARP *arp = pdu.find_pdu<Tins::ARP>();
            if (arp && arp->opcode() == Tins::ARP::REPLY)
                replies.Record(arp->sender_ip_addr().to_string(), arp->sender_hw_addr().to_string());
        };

        auto hosts = network.Hosts();
        std::cout << "[ArpSweeper] Sweeping " << network.ToString() << " (" << hosts.size()
                  << " hosts) on " << iface.name() << "\n";

        for (std::uint32_t host : hosts)
        {
            Tins::IPv4Address target(common::FormatAddress(host));
            Tins::EthernetII frame = Tins::ARP::make_arp_request(target, info.ip_addr, info.hw_addr);
            try
            {
                sender.send(frame, iface);
            }
            catch (const Tins::socket_open_error &e)
            {
                throw common::PermissionError("Cannot open raw link-layer socket on " + iface.name() + ": " + e.what());
            }
            catch (const Tins::socket_write_error &)
            {
                // That host stays absent.
            }
            capture.Collect(std::chrono::steady_clock::now() + m_spacing, onFrame);
        }

        capture.Collect(std::chrono::steady_clock::now() + m_window, onFrame);

        std::cout << "[ArpSweeper] " << replies.Entries().size() << " hosts answered\n";
        return replies.Take();
    }
}
