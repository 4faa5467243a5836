#include <csignal>
#include <cstdio>
#include <string>
#include <vector>

#include "app/config.hpp"
#include "app/stream_receiver.hpp"
#include "crypto/psk_aead.hpp"
#include "media/cv_media.hpp"
#include "transport/udp_transport.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

static transport::ITransport *g_tx = nullptr;

static void on_signal(int)
{
    // close() only raises a flag; receive() notices it on its next poll tick
    if (g_tx)
        g_tx->close();
}

int main(int argc, char **argv)
{
    framecast::init_log_level_from_env();

    app::ReceiverConfig cfg;
    std::string         err;
    switch (app::parse_receiver_args(std::vector<std::string>(argv + 1, argv + argc), cfg, err))
    {
        case app::ParseStatus::Help:
            std::fprintf(stderr, "%s", app::receiver_usage());
            return exitc::ok;
        case app::ParseStatus::Error:
            std::fprintf(stderr, "%s\nerror: %s\n", app::receiver_usage(), err.c_str());
            return exitc::bad_args;
        case app::ParseStatus::Ok:
            break;
    }
    if (!cfg.log_level.empty())
        framecast::set_log_level_by_name(cfg.log_level.c_str());

    LOG_SYSTEM("Config: mode=%s listen=%s:%u group=%s key=%s", transport::mode_name(cfg.mode),
               cfg.host.c_str(), static_cast<unsigned>(cfg.port),
               cfg.mode == transport::Mode::Multicast ? cfg.mcast_addr.c_str() : "(none)",
               cfg.key_path.c_str());

    auto key = aead::load_key_file(cfg.key_path);
    if (!key)
        return exitc::key_error;
    aead::SodiumPskAead opener(*key);

    transport::UdpTransport tx;
    if (!tx.open(cfg.transport_settings()))
    {
        LOG_ERROR("transport setup failed");
        return exitc::transport_error;
    }
    g_tx = &tx;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    media::JpegCodec codec;
    media::Window    window("framecast");
    cv::Mat          image;

    app::StreamReceiver receiver(
        tx, opener,
        [&](const app::ReceivedFrame &f) {
            if (!codec.decompress(f.jpeg, image))
                return true;  // undecodable frame, wait for the next one
            return window.show(image);
        },
        frag::DEFAULT_STALE_WINDOW, cfg.max_frame_size);

    LOG_INFO("waiting for stream...");
    const bool ok = receiver.run();
    g_tx          = nullptr;

    const auto &rs = receiver.stats();
    const auto &as = receiver.reassembly_stats();
    LOG_SYSTEM("receiver shut down: datagrams=%llu frames=%llu superseded=%llu malformed=%llu "
               "stale=%llu oversize=%llu auth_fail=%llu",
               (unsigned long long)rs.datagrams, (unsigned long long)rs.frames_delivered,
               (unsigned long long)as.superseded, (unsigned long long)as.dropped_malformed,
               (unsigned long long)as.dropped_stale, (unsigned long long)as.dropped_oversize,
               (unsigned long long)rs.auth_failures);
    return ok ? exitc::ok : exitc::runtime_error;
}
