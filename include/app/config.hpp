#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "proto/frag.hpp"
#include "transport/itransport.hpp"
#include "util/constants.hpp"

namespace app
{

enum class ParseStatus
{
    Ok,
    Help,  // --help was given, usage printed by the caller
    Error
};

struct SenderConfig
{
    std::string     host;
    std::uint16_t   port = constants::DEFAULT_PORT;
    transport::Mode mode = transport::Mode::Unicast;
    std::string     mcast_addr{constants::DEFAULT_MCAST_GROUP};
    std::string     interface;
    bool            loopback      = false;
    int             ttl           = constants::DEFAULT_MCAST_TTL;
    int             quality       = constants::DEFAULT_JPEG_QUALITY;
    std::string     key_path{constants::DEFAULT_KEY_PATH};
    std::size_t     chunk_size    = 0;  // max chunk payload; filled from DEFAULT_MAX_DATAGRAM
    int             camera_index  = constants::DEFAULT_CAMERA_INDEX;
    std::string     log_level;

    transport::Settings transport_settings() const;
};

struct ReceiverConfig
{
    std::string     host{constants::DEFAULT_BIND_ADDR};
    std::uint16_t   port = constants::DEFAULT_PORT;
    transport::Mode mode = transport::Mode::Unicast;
    std::string     mcast_addr{constants::DEFAULT_MCAST_GROUP};
    std::string     interface;
    bool            loopback = false;
    std::string     key_path{constants::DEFAULT_KEY_PATH};
    std::size_t     max_frame_size = frag::DEFAULT_MAX_FRAME_BYTES;
    std::string     log_level;

    transport::Settings transport_settings() const;
};

// args excludes argv[0]; on Error `err` says why
ParseStatus parse_sender_args(const std::vector<std::string> &args,
                              SenderConfig                   &out,
                              std::string                    &err);
ParseStatus parse_receiver_args(const std::vector<std::string> &args,
                                ReceiverConfig                 &out,
                                std::string                    &err);

const char *sender_usage();
const char *receiver_usage();

}  // namespace app
