#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "transport/udp_transport.hpp"
#include "util/log.hpp"

namespace transport
{

// receive() wakes up this often to notice close()
static constexpr int POLL_TICK_MS = 200;

static bool parse_ipv4(const std::string &text, in_addr &out)
{
    return inet_pton(AF_INET, text.c_str(), &out) == 1;
}

const char *mode_name(Mode m)
{
    return m == Mode::Multicast ? "multicast" : "unicast";
}

UdpTransport::~UdpTransport()
{
    release();
}

bool UdpTransport::open(const Settings &s)
{
    release();
    settings_ = s;
    closing_.store(false);

    if (s.max_datagram == 0 || s.max_datagram > constants::MAX_UDP_PAYLOAD)
    {
        LOG_ERROR("invalid max datagram size %zu (1..%zu)", s.max_datagram,
                  constants::MAX_UDP_PAYLOAD);
        return false;
    }

    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (fd == -1)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    fd_.store(fd);

    const bool ok = (s.role == Role::Sender) ? setup_sender() : setup_receiver();
    if (!ok)
    {
        release();
        return false;
    }
    return true;
}

bool UdpTransport::setup_sender()
{
    const int fd = fd_.load();
    const std::string &dst =
        settings_.mode == Mode::Multicast ? settings_.group : settings_.host;

    dest_            = {};
    dest_.sin_family = AF_INET;
    dest_.sin_port   = htons(settings_.port);
    if (!parse_ipv4(dst, dest_.sin_addr))
    {
        LOG_ERROR("invalid destination address: %s", dst.c_str());
        return false;
    }

    if (settings_.mode == Mode::Unicast)
    {
        LOG_INFO("unicast sender -> %s:%u", dst.c_str(), static_cast<unsigned>(settings_.port));
        return true;
    }

    if (!IN_MULTICAST(ntohl(dest_.sin_addr.s_addr)))
    {
        LOG_ERROR("%s is not a multicast group address", dst.c_str());
        return false;
    }
    if (!settings_.interface.empty())
    {
        in_addr iface{};
        if (!parse_ipv4(settings_.interface, iface))
        {
            LOG_ERROR("invalid interface address: %s", settings_.interface.c_str());
            return false;
        }
        if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface)) == -1)
        {
            LOG_ERROR("setsockopt(IP_MULTICAST_IF, %s) failed: %s", settings_.interface.c_str(),
                      std::strerror(errno));
            return false;
        }
    }
    unsigned char ttl = static_cast<unsigned char>(settings_.ttl);
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) == -1)
    {
        LOG_ERROR("setsockopt(IP_MULTICAST_TTL) failed: %s", std::strerror(errno));
        return false;
    }
    unsigned char loop = settings_.loopback ? 1 : 0;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) == -1)
    {
        LOG_ERROR("setsockopt(IP_MULTICAST_LOOP) failed: %s", std::strerror(errno));
        return false;
    }
    LOG_INFO("multicast sender -> %s:%u (interface=%s ttl=%d loopback=%s)", dst.c_str(),
             static_cast<unsigned>(settings_.port),
             settings_.interface.empty() ? "default" : settings_.interface.c_str(),
             settings_.ttl, settings_.loopback ? "on" : "off");
    return true;
}

bool UdpTransport::setup_receiver()
{
    const int fd = fd_.load();

    int reuse = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == -1)
    {
        LOG_WARN("setsockopt(SO_REUSEADDR) failed: %s", std::strerror(errno));
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_port   = htons(settings_.port);
    if (settings_.mode == Mode::Multicast)
    {
        // bind the wildcard so group traffic is delivered regardless of host
        local.sin_addr.s_addr = htonl(INADDR_ANY);
    }
    else if (settings_.host.empty())
    {
        local.sin_addr.s_addr = htonl(INADDR_ANY);
    }
    else if (!parse_ipv4(settings_.host, local.sin_addr))
    {
        LOG_ERROR("invalid bind address: %s", settings_.host.c_str());
        return false;
    }

    if (bind(fd, reinterpret_cast<sockaddr *>(&local), sizeof(local)) == -1)
    {
        LOG_ERROR("bind(:%u) failed: %s", static_cast<unsigned>(settings_.port),
                  std::strerror(errno));
        return false;
    }

    if (settings_.mode == Mode::Unicast)
    {
        LOG_INFO("unicast receiver listening on %s:%u",
                 settings_.host.empty() ? "0.0.0.0" : settings_.host.c_str(),
                 static_cast<unsigned>(local_port()));
        return true;
    }

    ip_mreq mreq{};
    if (!parse_ipv4(settings_.group, mreq.imr_multiaddr) ||
        !IN_MULTICAST(ntohl(mreq.imr_multiaddr.s_addr)))
    {
        LOG_ERROR("invalid multicast group: %s", settings_.group.c_str());
        return false;
    }
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (!settings_.interface.empty() && !parse_ipv4(settings_.interface, mreq.imr_interface))
    {
        LOG_ERROR("invalid interface address: %s", settings_.interface.c_str());
        return false;
    }
    if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) == -1)
    {
        LOG_ERROR("failed to join multicast group %s: %s", settings_.group.c_str(),
                  std::strerror(errno));
        return false;
    }
    unsigned char loop = settings_.loopback ? 1 : 0;
    if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) == -1)
    {
        LOG_WARN("setsockopt(IP_MULTICAST_LOOP) failed: %s", std::strerror(errno));
    }
    LOG_INFO("multicast receiver joined %s:%u (interface=%s)", settings_.group.c_str(),
             static_cast<unsigned>(settings_.port),
             settings_.interface.empty() ? "default" : settings_.interface.c_str());
    return true;
}

bool UdpTransport::send(const Datagram &one_datagram)
{
    const int fd = fd_.load();
    if (fd == -1 || closing_.load() || settings_.role != Role::Sender)
        return false;
    if (one_datagram.size() > settings_.max_datagram)
    {
        LOG_ERROR("datagram too large (%zu > %zu)", one_datagram.size(), settings_.max_datagram);
        return false;
    }

    while (true)
    {
        ssize_t n = ::sendto(fd, one_datagram.data(), one_datagram.size(), 0,
                             reinterpret_cast<const sockaddr *>(&dest_), sizeof(dest_));
        if (n >= 0)
            return static_cast<std::size_t>(n) == one_datagram.size();
        if (errno == EINTR)
            continue;
        LOG_ERROR("sendto() failed: %s", std::strerror(errno));
        return false;
    }
}

RecvStatus UdpTransport::receive(Datagram &out)
{
    // one IPv4 UDP payload never exceeds this
    out.resize(constants::MAX_UDP_PAYLOAD);

    while (!closing_.load())
    {
        const int fd = fd_.load();
        if (fd == -1)
            return RecvStatus::Closed;

        pollfd pfd{};
        pfd.fd     = fd;
        pfd.events = POLLIN;
        int pr     = ::poll(&pfd, 1, POLL_TICK_MS);
        if (pr == 0)
            continue;
        if (pr == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("poll() failed: %s", std::strerror(errno));
            return RecvStatus::Error;
        }

        ssize_t n = ::recvfrom(fd, out.data(), out.size(), MSG_DONTWAIT, nullptr, nullptr);
        if (n >= 0)
        {
            out.resize(static_cast<std::size_t>(n));
            return RecvStatus::Ok;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)
            continue;
        if (closing_.load())
            break;
        LOG_ERROR("recvfrom() failed: %s", std::strerror(errno));
        return RecvStatus::Error;
    }
    return RecvStatus::Closed;
}

void UdpTransport::close()
{
    // only flag here; the fd is released by the owner, after receive() returned
    closing_.store(true);
}

void UdpTransport::release()
{
    closing_.store(true);
    int fd = fd_.exchange(-1);
    if (fd != -1)
        ::close(fd);
}

std::uint16_t UdpTransport::local_port() const
{
    sockaddr_in addr{};
    socklen_t   len = sizeof(addr);
    const int   fd  = fd_.load();
    if (fd == -1 || getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == -1)
        return 0;
    return ntohs(addr.sin_port);
}

}  // namespace transport
