#pragma once
#include <atomic>
#include <netinet/in.h>

#include "transport/itransport.hpp"

namespace transport
{

// IPv4 UDP, unicast or multicast. Receivers bind `host:port`; in multicast
// mode they also join `group` on `interface` before the first receive.
class UdpTransport final : public ITransport
{
  public:
    UdpTransport() = default;
    ~UdpTransport() override;
    UdpTransport(const UdpTransport &)            = delete;
    UdpTransport &operator=(const UdpTransport &) = delete;

    bool        open(const Settings &s) override;
    bool        send(const Datagram &one_datagram) override;
    RecvStatus  receive(Datagram &out) override;
    void        close() override;
    std::string name() const override { return "udp"; }

    // Port actually bound (useful when 0 was requested)
    std::uint16_t local_port() const;

  private:
    bool setup_sender();
    bool setup_receiver();
    void release();

    Settings          settings_{};
    sockaddr_in       dest_{};
    std::atomic<int>  fd_{-1};
    std::atomic<bool> closing_{false};
};

}  // namespace transport
