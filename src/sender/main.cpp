#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include "app/config.hpp"
#include "app/stream_sender.hpp"
#include "crypto/psk_aead.hpp"
#include "media/cv_media.hpp"
#include "proto/stamp.hpp"
#include "transport/udp_transport.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"
#include "util/stats.hpp"

static std::atomic<bool> g_stop{false};

static void on_signal(int)
{
    g_stop.store(true);
}

int main(int argc, char **argv)
{
    framecast::init_log_level_from_env();

    app::SenderConfig cfg;
    std::string       err;
    switch (app::parse_sender_args(std::vector<std::string>(argv + 1, argv + argc), cfg, err))
    {
        case app::ParseStatus::Help:
            std::fprintf(stderr, "%s", app::sender_usage());
            return exitc::ok;
        case app::ParseStatus::Error:
            std::fprintf(stderr, "%s\nerror: %s\n", app::sender_usage(), err.c_str());
            return exitc::bad_args;
        case app::ParseStatus::Ok:
            break;
    }
    if (!cfg.log_level.empty())
        framecast::set_log_level_by_name(cfg.log_level.c_str());

    LOG_SYSTEM("Config: mode=%s dest=%s:%u quality=%d chunk=%zu key=%s",
               transport::mode_name(cfg.mode),
               cfg.mode == transport::Mode::Multicast ? cfg.mcast_addr.c_str() : cfg.host.c_str(),
               static_cast<unsigned>(cfg.port), cfg.quality, cfg.chunk_size,
               cfg.key_path.c_str());

    auto key = aead::load_key_file(cfg.key_path);
    if (!key)
        return exitc::key_error;
    aead::SodiumPskAead sealer(*key);

    transport::UdpTransport tx;
    if (!tx.open(cfg.transport_settings()))
    {
        LOG_ERROR("transport setup failed");
        return exitc::transport_error;
    }

    media::Camera    camera(cfg.camera_index);
    media::JpegCodec codec(cfg.quality);
    if (!camera.open())
        return exitc::media_error;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    app::StreamSender sender(tx, sealer, cfg.chunk_size, app::random_frame_id());
    stats::RateMeter  rate;
    LOG_INFO("streaming, Ctrl-C to stop");

    cv::Mat                   frame;
    std::vector<std::uint8_t> jpeg;
    while (!g_stop.load())
    {
        const std::uint64_t t0 = stamp::now_ns();
        if (!camera.capture(frame))
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            continue;
        }
        if (!codec.compress(frame, jpeg))
            continue;
        // failures are logged inside; a dropped frame does not stop the stream
        (void)sender.send_frame(jpeg, t0);

        if (auto fps = rate.tick(stamp::now_ns()))
        {
            LOG_INFO("throughput %.2f frames/sec (sent=%llu dropped=%llu)", *fps,
                     (unsigned long long)sender.stats().frames_sent,
                     (unsigned long long)sender.stats().frames_dropped);
        }
    }

    LOG_SYSTEM("stopping: %llu frames sent, %llu dropped",
               (unsigned long long)sender.stats().frames_sent,
               (unsigned long long)sender.stats().frames_dropped);
    tx.close();
    return exitc::ok;
}
