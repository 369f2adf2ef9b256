#include "IcmpPinger.hpp"
#include "CaptureSession.hpp"
#include "../common/Errors.hpp"

#include <tins/tins.h>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace net_survey::scanner
{
    IcmpPinger::IcmpPinger(std::chrono::milliseconds timeout, std::chrono::milliseconds spacing)
        : m_timeout(timeout), m_spacing(spacing), m_identifier(static_cast<std::uint16_t>(getpid() & 0xFFFF))
    {
    }

    RttMap IcmpPinger::Probe(const std::vector<std::string> &ips,
                             const std::optional<std::string> &interface_name)
    {
        RttMap rtts;
        if (ips.empty())
            return rtts;

        std::string ifaceName;
        try
        {
            ifaceName = interface_name ? *interface_name : Tins::NetworkInterface::default_interface().name();
        }
        catch (const Tins::invalid_interface &)
        {
            std::cerr << "[Pinger] Unknown network interface " << interface_name.value_or("(default)")
                      << ", liveness skipped\n";
            return rtts;
        }

        std::unique_ptr<CaptureSession> capture;
        try
        {
            capture = std::make_unique<CaptureSession>(ifaceName, "icmp and icmp[icmptype] == icmp-echoreply");
        }
        catch (const common::ScanError &e)
        {
            std::cerr << "[Pinger] " << e.what() << ", liveness skipped\n";
            return rtts;
        }

        Tins::PacketSender sender;
        std::uint16_t sequence = 0;

        for (const auto &target : ips)
        {
            ++sequence;

            Tins::IP packet = Tins::IP(target) / Tins::ICMP();
            Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
            icmp.type(Tins::ICMP::ECHO_REQUEST);
            icmp.id(m_identifier);
            icmp.sequence(sequence);

            auto start = std::chrono::steady_clock::now();
            try
            {
                sender.send(packet);
            }
            catch (const Tins::socket_open_error &e)
            {
                std::cerr << "[Pinger] Cannot open raw socket: " << e.what() << "\n";
                return rtts;
            }
            catch (const Tins::socket_write_error &)
            {
                std::this_thread::sleep_for(m_spacing);
                continue;
            }

            std::chrono::steady_clock::time_point end;
            bool answered = capture->CollectUntil(start + m_timeout, [&](const Tins::PDU &pdu)
                                                 {
                const Tins::IP *ip = pdu.find_pdu<Tins::IP>();
                const Tins::ICMP *reply = pdu.find_pdu<Tins::ICMP>();
                if (!ip || !reply || reply->type() != Tins::ICMP::ECHO_REPLY)
                    return false;
                if (ip->src_addr().to_string() != target)
                    return false;
                if (reply->id() != m_identifier || reply->sequence() != sequence)
                    return false;
                end = std::chrono::steady_clock::now();
                return true; });

            if (answered)
            {
                std::chrono::duration<double, std::milli> elapsed = end - start;
                rtts[target] = elapsed.count();
            }

            std::this_thread::sleep_for(m_spacing);
        }

        std::cout << "[Pinger] " << rtts.size() << "/" << ips.size() << " hosts answered echo\n";
        return rtts;
    }
}
