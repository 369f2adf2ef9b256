#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace Tins
{
    class PDU;
    class Sniffer;
}

namespace net_survey::scanner
{
    // Non-blocking pcap handle bound to one interface and BPF filter.
    // Collect() hands every captured frame to the handler until the deadline,
    // so callers can interleave sending with receiving on one thread.
    class CaptureSession
    {
    public:
        using PacketHandler = std::function<void(const Tins::PDU &)>;

        // Throws common::PermissionError when the capture cannot be opened.
        CaptureSession(const std::string &interface_name, const std::string &filter);
        ~CaptureSession();

        CaptureSession(const CaptureSession &) = delete;
        CaptureSession &operator=(const CaptureSession &) = delete;

        void Collect(std::chrono::steady_clock::time_point deadline, const PacketHandler &handler);

        // Returns early once the handler reports true.
        bool CollectUntil(std::chrono::steady_clock::time_point deadline,
                          const std::function<bool(const Tins::PDU &)> &handler);

    private:
        bool Drain(const std::function<bool(const Tins::PDU &)> &handler);

        std::unique_ptr<Tins::Sniffer> m_sniffer;
        int m_fd;
    };
}
