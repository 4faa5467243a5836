#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "util/constants.hpp"

namespace transport
{

using Datagram = std::vector<std::uint8_t>;

enum class Mode
{
    Unicast,
    Multicast
};

enum class Role
{
    Sender,
    Receiver
};

enum class RecvStatus
{
    Ok,
    Closed,  // transport was closed, stop the loop
    Error
};

struct Settings
{
    Mode          mode = Mode::Unicast;
    Role          role = Role::Sender;
    std::string   host;       // destination (sender) or bind address (receiver)
    std::string   group{constants::DEFAULT_MCAST_GROUP};
    std::uint16_t port = constants::DEFAULT_PORT;
    std::string   interface;  // local IPv4 selecting the multicast interface, empty = default
    bool          loopback     = false;
    int           ttl          = constants::DEFAULT_MCAST_TTL;
    std::size_t   max_datagram = constants::DEFAULT_MAX_DATAGRAM;
};

const char *mode_name(Mode m);

struct ITransport
{
    virtual bool        open(const Settings &s)              = 0;
    virtual bool        send(const Datagram &one_datagram)   = 0;
    // Blocks until exactly one datagram arrives or the transport is closed
    virtual RecvStatus  receive(Datagram &out)               = 0;
    virtual void        close()                              = 0;
    virtual std::string name() const { return ""; }
    virtual ~ITransport() = default;
};

}  // namespace transport
