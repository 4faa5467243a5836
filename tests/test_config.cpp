#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/config.hpp"
#include "proto/frag.hpp"

using app::ParseStatus;

namespace
{
// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};
}  // namespace

TEST(SenderConfig, Defaults)
{
    EnvGuard g("FRAMECAST_KEY");
    g.unset();

    app::SenderConfig cfg;
    std::string       err;
    ASSERT_EQ(app::parse_sender_args({"192.168.1.20", "6000"}, cfg, err), ParseStatus::Ok) << err;
    EXPECT_EQ(cfg.host, "192.168.1.20");
    EXPECT_EQ(cfg.port, 6000);
    EXPECT_EQ(cfg.mode, transport::Mode::Unicast);
    EXPECT_EQ(cfg.quality, 90);
    EXPECT_EQ(cfg.key_path, "secret.key");
    EXPECT_EQ(cfg.chunk_size, 1472u - frag::HDR_SIZE);
    EXPECT_EQ(cfg.ttl, 1);
    EXPECT_FALSE(cfg.loopback);

    auto s = cfg.transport_settings();
    EXPECT_EQ(s.role, transport::Role::Sender);
    EXPECT_EQ(s.max_datagram, 1472u);
}

TEST(SenderConfig, AllOptions)
{
    app::SenderConfig cfg;
    std::string       err;
    const std::vector<std::string> args = {
        "10.0.0.5",         "7000",        "--mode",    "multicast", "--mcast-addr=239.9.9.9",
        "--interface",      "10.0.0.2",    "--loopback", "--ttl",    "4",
        "--quality",        "55",          "--key_path", "/tmp/k",   "--chunk-size",
        "1000",             "--camera",    "2",          "--log-level", "debug"};
    ASSERT_EQ(app::parse_sender_args(args, cfg, err), ParseStatus::Ok) << err;
    EXPECT_EQ(cfg.mode, transport::Mode::Multicast);
    EXPECT_EQ(cfg.mcast_addr, "239.9.9.9");
    EXPECT_EQ(cfg.interface, "10.0.0.2");
    EXPECT_TRUE(cfg.loopback);
    EXPECT_EQ(cfg.ttl, 4);
    EXPECT_EQ(cfg.quality, 55);
    EXPECT_EQ(cfg.key_path, "/tmp/k");
    EXPECT_EQ(cfg.chunk_size, 1000u);
    EXPECT_EQ(cfg.camera_index, 2);
    EXPECT_EQ(cfg.log_level, "debug");

    auto s = cfg.transport_settings();
    EXPECT_EQ(s.group, "239.9.9.9");
    EXPECT_EQ(s.max_datagram, 1000u + frag::HDR_SIZE);
    EXPECT_TRUE(s.loopback);
}

TEST(SenderConfig, KeyPathFromEnv)
{
    EnvGuard g("FRAMECAST_KEY");
    g.set("/etc/framecast.key");

    app::SenderConfig cfg;
    std::string       err;
    ASSERT_EQ(app::parse_sender_args({"127.0.0.1", "5005"}, cfg, err), ParseStatus::Ok);
    EXPECT_EQ(cfg.key_path, "/etc/framecast.key");

    // command line wins over env
    ASSERT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--key", "x.key"}, cfg, err),
              ParseStatus::Ok);
    EXPECT_EQ(cfg.key_path, "x.key");
}

TEST(SenderConfig, RejectsBadValues)
{
    app::SenderConfig cfg;
    std::string       err;
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1"}, cfg, err), ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"host.example", "5005"}, cfg, err), ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "70000"}, cfg, err), ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--quality", "0"}, cfg, err),
              ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--quality", "101"}, cfg, err),
              ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--mode", "broadcast"}, cfg, err),
              ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--chunk-size", "0"}, cfg, err),
              ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--chunk-size", "70000"}, cfg, err),
              ParseStatus::Error);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--ttl"}, cfg, err),
              ParseStatus::Error);
    EXPECT_NE(err.find("missing value"), std::string::npos);
    EXPECT_EQ(app::parse_sender_args({"127.0.0.1", "5005", "--bogus"}, cfg, err),
              ParseStatus::Error);
    EXPECT_NE(err.find("unknown option"), std::string::npos);
}

TEST(SenderConfig, Help)
{
    app::SenderConfig cfg;
    std::string       err;
    EXPECT_EQ(app::parse_sender_args({"--help"}, cfg, err), ParseStatus::Help);
    EXPECT_NE(std::string(app::sender_usage()).find("--chunk-size"), std::string::npos);
}

TEST(ReceiverConfig, DefaultsAndOptions)
{
    EnvGuard g("FRAMECAST_KEY");
    g.unset();

    app::ReceiverConfig cfg;
    std::string         err;
    ASSERT_EQ(app::parse_receiver_args({"5005"}, cfg, err), ParseStatus::Ok) << err;
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.port, 5005);
    EXPECT_EQ(cfg.key_path, "secret.key");
    EXPECT_EQ(cfg.max_frame_size, frag::DEFAULT_MAX_FRAME_BYTES);
    EXPECT_EQ(cfg.transport_settings().role, transport::Role::Receiver);

    ASSERT_EQ(app::parse_receiver_args({"--mode", "multicast", "6000", "--interface",
                                        "192.168.0.9", "--loopback", "--host", "127.0.0.1",
                                        "--max-frame-size=1000000"},
                                       cfg, err),
              ParseStatus::Ok)
        << err;
    EXPECT_EQ(cfg.port, 6000);
    EXPECT_EQ(cfg.mode, transport::Mode::Multicast);
    EXPECT_EQ(cfg.interface, "192.168.0.9");
    EXPECT_TRUE(cfg.loopback);
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.max_frame_size, 1000000u);
}

TEST(ReceiverConfig, RejectsBadValues)
{
    app::ReceiverConfig cfg;
    std::string         err;
    EXPECT_EQ(app::parse_receiver_args({}, cfg, err), ParseStatus::Error);
    EXPECT_EQ(app::parse_receiver_args({"0"}, cfg, err), ParseStatus::Error);
    EXPECT_EQ(app::parse_receiver_args({"5005", "6000"}, cfg, err), ParseStatus::Error);
    EXPECT_EQ(app::parse_receiver_args({"5005", "--interface", "eth0"}, cfg, err),
              ParseStatus::Error);
    EXPECT_EQ(app::parse_receiver_args({"5005", "--log-level", "loud"}, cfg, err),
              ParseStatus::Error);
    // below one datagram's payload
    EXPECT_EQ(app::parse_receiver_args({"5005", "--max-frame-size", "10"}, cfg, err),
              ParseStatus::Error);
}
