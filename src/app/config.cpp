#include <arpa/inet.h>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <unordered_map>

#include "app/config.hpp"
#include "proto/frag.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{

bool parse_long(const std::string &s, long lo, long hi, long &out)
{
    if (s.empty())
        return false;
    char *end = nullptr;
    errno     = 0;
    long v    = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0' || v < lo || v > hi)
        return false;
    out = v;
    return true;
}

bool is_ipv4(const std::string &s)
{
    in_addr a{};
    return inet_pton(AF_INET, s.c_str(), &a) == 1;
}

bool parse_mode(const std::string &s, transport::Mode &out)
{
    if (s == "unicast")
        out = transport::Mode::Unicast;
    else if (s == "multicast")
        out = transport::Mode::Multicast;
    else
        return false;
    return true;
}

std::string default_key_path()
{
    if (const char *e = std::getenv(constants::ENV_KEY_PATH); e && *e)
        return e;
    return std::string(constants::DEFAULT_KEY_PATH);
}

// Option table: name -> handler(value). Flags take no value.
struct Options
{
    std::unordered_map<std::string, std::function<bool(const std::string &)>> valued;
    std::unordered_map<std::string, std::function<void()>>                    flags;
};

// Splits args into options and positionals; "--name=value" and "--name value" both work
ParseStatus run_options(const std::vector<std::string> &args,
                        const Options                  &opts,
                        std::vector<std::string>       &positionals,
                        std::string                    &err)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        std::string a = args[i];
        if (a == "--help" || a == "-h")
            return ParseStatus::Help;
        if (a.rfind("--", 0) != 0)
        {
            positionals.push_back(a);
            continue;
        }
        std::string value;
        bool        inline_value = false;
        if (auto eq = a.find('='); eq != std::string::npos)
        {
            value        = a.substr(eq + 1);
            a            = a.substr(0, eq);
            inline_value = true;
        }
        // accept --key_path as well as --key-path
        for (auto &c : a)
            if (c == '_')
                c = '-';

        if (auto f = opts.flags.find(a); f != opts.flags.end() && !inline_value)
        {
            f->second();
            continue;
        }
        auto v = opts.valued.find(a);
        if (v == opts.valued.end())
        {
            err = "unknown option: " + args[i];
            return ParseStatus::Error;
        }
        if (!inline_value)
        {
            if (i + 1 >= args.size())
            {
                err = "missing value for " + a;
                return ParseStatus::Error;
            }
            value = args[++i];
        }
        if (!v->second(value))
        {
            err = "invalid value for " + a + ": " + value;
            return ParseStatus::Error;
        }
    }
    return ParseStatus::Ok;
}

}  // namespace

transport::Settings SenderConfig::transport_settings() const
{
    transport::Settings s{};
    s.mode         = mode;
    s.role         = transport::Role::Sender;
    s.host         = host;
    s.group        = mcast_addr;
    s.port         = port;
    s.interface    = interface;
    s.loopback     = loopback;
    s.ttl          = ttl;
    s.max_datagram = chunk_size + frag::HDR_SIZE;
    return s;
}

transport::Settings ReceiverConfig::transport_settings() const
{
    transport::Settings s{};
    s.mode      = mode;
    s.role      = transport::Role::Receiver;
    s.host      = host;
    s.group     = mcast_addr;
    s.port      = port;
    s.interface = interface;
    s.loopback  = loopback;
    // accept anything the network can carry; the sender enforces its own ceiling
    s.max_datagram = constants::MAX_UDP_PAYLOAD;
    return s;
}

ParseStatus parse_sender_args(const std::vector<std::string> &args,
                              SenderConfig                   &out,
                              std::string                    &err)
{
    SenderConfig cfg;
    cfg.key_path   = default_key_path();
    cfg.chunk_size = constants::DEFAULT_MAX_DATAGRAM - frag::HDR_SIZE;

    long    n = 0;
    Options opts;
    opts.valued["--mode"]       = [&](const std::string &v) { return parse_mode(v, cfg.mode); };
    opts.valued["--mcast-addr"] = [&](const std::string &v) {
        cfg.mcast_addr = v;
        return is_ipv4(v);
    };
    opts.valued["--interface"] = [&](const std::string &v) {
        cfg.interface = v;
        return is_ipv4(v);
    };
    opts.valued["--ttl"] = [&](const std::string &v) {
        if (!parse_long(v, 0, 255, n))
            return false;
        cfg.ttl = static_cast<int>(n);
        return true;
    };
    opts.valued["--quality"] = [&](const std::string &v) {
        if (!parse_long(v, 1, 100, n))
            return false;
        cfg.quality = static_cast<int>(n);
        return true;
    };
    opts.valued["--key"]      = [&](const std::string &v) {
        cfg.key_path = v;
        return !v.empty();
    };
    opts.valued["--key-path"] = opts.valued["--key"];
    opts.valued["--chunk-size"] = [&](const std::string &v) {
        if (!parse_long(v, 1, static_cast<long>(frag::MAX_PAYLOAD), n))
            return false;
        cfg.chunk_size = static_cast<std::size_t>(n);
        return true;
    };
    opts.valued["--camera"] = [&](const std::string &v) {
        if (!parse_long(v, 0, 255, n))
            return false;
        cfg.camera_index = static_cast<int>(n);
        return true;
    };
    opts.valued["--camera-index"] = opts.valued["--camera"];
    opts.valued["--log-level"]    = [&](const std::string &v) {
        cfg.log_level = v;
        return framecast::level_from_name(v.c_str()).has_value();
    };
    opts.flags["--loopback"] = [&] { cfg.loopback = true; };

    std::vector<std::string> pos;
    ParseStatus              st = run_options(args, opts, pos, err);
    if (st != ParseStatus::Ok)
        return st;

    if (pos.size() != 2)
    {
        err = "expected <host> <port>";
        return ParseStatus::Error;
    }
    cfg.host = pos[0];
    if (!is_ipv4(cfg.host))
    {
        err = "invalid host address: " + cfg.host;
        return ParseStatus::Error;
    }
    if (!parse_long(pos[1], 1, 65535, n))
    {
        err = "invalid port: " + pos[1];
        return ParseStatus::Error;
    }
    cfg.port = static_cast<std::uint16_t>(n);

    out = std::move(cfg);
    return ParseStatus::Ok;
}

ParseStatus parse_receiver_args(const std::vector<std::string> &args,
                                ReceiverConfig                 &out,
                                std::string                    &err)
{
    ReceiverConfig cfg;
    cfg.key_path = default_key_path();

    long    n = 0;
    Options opts;
    opts.valued["--host"] = [&](const std::string &v) {
        cfg.host = v;
        return is_ipv4(v);
    };
    opts.valued["--mode"]       = [&](const std::string &v) { return parse_mode(v, cfg.mode); };
    opts.valued["--mcast-addr"] = [&](const std::string &v) {
        cfg.mcast_addr = v;
        return is_ipv4(v);
    };
    opts.valued["--interface"] = [&](const std::string &v) {
        cfg.interface = v;
        return is_ipv4(v);
    };
    opts.valued["--key"] = [&](const std::string &v) {
        cfg.key_path = v;
        return !v.empty();
    };
    opts.valued["--key-path"]       = opts.valued["--key"];
    opts.valued["--max-frame-size"] = [&](const std::string &v) {
        // at least one full datagram's worth
        if (!parse_long(v, static_cast<long>(frag::MAX_PAYLOAD), 1L << 30, n))
            return false;
        cfg.max_frame_size = static_cast<std::size_t>(n);
        return true;
    };
    opts.valued["--log-level"] = [&](const std::string &v) {
        cfg.log_level = v;
        return framecast::level_from_name(v.c_str()).has_value();
    };
    opts.flags["--loopback"] = [&] { cfg.loopback = true; };

    std::vector<std::string> pos;
    ParseStatus              st = run_options(args, opts, pos, err);
    if (st != ParseStatus::Ok)
        return st;

    if (pos.size() != 1)
    {
        err = "expected <port>";
        return ParseStatus::Error;
    }
    if (!parse_long(pos[0], 1, 65535, n))
    {
        err = "invalid port: " + pos[0];
        return ParseStatus::Error;
    }
    cfg.port = static_cast<std::uint16_t>(n);

    out = std::move(cfg);
    return ParseStatus::Ok;
}

const char *sender_usage()
{
    return "Usage:\n"
           "  framecast-send <host> <port> [options]\n"
           "\n"
           "Options:\n"
           "  --mode unicast|multicast   (default unicast)\n"
           "  --mcast-addr <ip>          multicast group (default 239.1.2.3)\n"
           "  --interface <ip>           local interface for multicast\n"
           "  --loopback                 receive own multicast on this host\n"
           "  --ttl <0..255>             multicast TTL (default 1)\n"
           "  --quality <1..100>         JPEG quality (default 90)\n"
           "  --key <path>               key file (default $FRAMECAST_KEY or secret.key)\n"
           "  --chunk-size <bytes>       max payload per datagram (default 1460)\n"
           "  --camera <index>           camera index (default 0)\n"
           "  --log-level debug|info|warn|error\n";
}

const char *receiver_usage()
{
    return "Usage:\n"
           "  framecast-recv <port> [options]\n"
           "\n"
           "Options:\n"
           "  --host <ip>                bind address (default 0.0.0.0)\n"
           "  --mode unicast|multicast   (default unicast)\n"
           "  --mcast-addr <ip>          multicast group (default 239.1.2.3)\n"
           "  --interface <ip>           local interface to join the group on\n"
           "  --loopback                 enable multicast loopback\n"
           "  --key <path>               key file (default $FRAMECAST_KEY or secret.key)\n"
           "  --max-frame-size <bytes>   largest encrypted frame buffered (default 16 MiB)\n"
           "  --log-level debug|info|warn|error\n";
}

}  // namespace app
