#include "CaptureSession.hpp"
#include "../common/Errors.hpp"

#include <tins/tins.h>
#include <pcap.h>
#include <poll.h>
#include <algorithm>

namespace net_survey::scanner
{
    namespace
    {
        // Upper bound on one poll() so frames left in a partially read ring
        // block are still drained promptly.
        constexpr std::chrono::milliseconds POLL_SLICE{25};

        bool wait_readable(int fd, std::chrono::milliseconds timeout)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;

            int r = poll(&pfd, 1, static_cast<int>(timeout.count()));
            return r > 0;
        }
    }

    CaptureSession::CaptureSession(const std::string &interface_name, const std::string &filter)
        : m_fd(-1)
    {
        Tins::SnifferConfiguration config;
        config.set_promisc_mode(false);
        config.set_immediate_mode(true);
        config.set_filter(filter);
        config.set_timeout(10);

        try
        {
            m_sniffer = std::make_unique<Tins::Sniffer>(interface_name, config);
        }
        catch (const Tins::pcap_error &e)
        {
            throw common::PermissionError("Cannot open link-layer capture on " + interface_name + ": " + e.what());
        }
        catch (const Tins::invalid_pcap_filter &e)
        {
            throw common::ScanError("Capture filter rejected: " + std::string(e.what()));
        }
        catch (const Tins::exception_base &e)
        {
            throw common::ScanError("Cannot open capture on " + interface_name + ": " + e.what());
        }

        char errbuf[PCAP_ERRBUF_SIZE];
        if (pcap_setnonblock(m_sniffer->get_pcap_handle(), 1, errbuf) == -1)
            throw common::ScanError("Cannot switch capture to non-blocking mode: " + std::string(errbuf));

        m_fd = m_sniffer->get_fd();
    }

    CaptureSession::~CaptureSession() = default;

    void CaptureSession::Collect(std::chrono::steady_clock::time_point deadline, const PacketHandler &handler)
    {
        CollectUntil(deadline, [&handler](const Tins::PDU &pdu)
                     {
            handler(pdu);
            return false; });
    }

    bool CaptureSession::CollectUntil(std::chrono::steady_clock::time_point deadline,
                                      const std::function<bool(const Tins::PDU &)> &handler)
    {
        while (true)
        {
            if (Drain(handler))
                return true;

            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
                return false;

            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            wait_readable(m_fd, std::min(std::max(remaining, std::chrono::milliseconds(1)), POLL_SLICE));
        }
    }

    bool CaptureSession::Drain(const std::function<bool(const Tins::PDU &)> &handler)
    {
        while (true)
        {
            Tins::Packet packet = m_sniffer->next_packet();
            if (!packet.pdu())
                return false;
            if (handler(*packet.pdu()))
                return true;
        }
    }
}
