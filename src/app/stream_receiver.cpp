#include <utility>

#include "app/frame_aad.hpp"
#include "app/stream_receiver.hpp"
#include "proto/stamp.hpp"
#include "util/log.hpp"

namespace app
{

StreamReceiver::StreamReceiver(transport::ITransport &t,
                               aead::PskAead         &aead,
                               FrameHandler           on_frame,
                               std::uint32_t          stale_window,
                               std::size_t            max_frame_bytes)
    : tx_(t), aead_(aead), on_frame_(std::move(on_frame)), rx_(stale_window, max_frame_bytes)
{
}

bool StreamReceiver::run()
{
    stop_.store(false);
    transport::Datagram d;
    while (!stop_.load())
    {
        switch (tx_.receive(d))
        {
            case transport::RecvStatus::Ok:
                if (!on_datagram(d))
                    return true;
                break;
            case transport::RecvStatus::Closed:
                LOG_INFO("transport closed, leaving receive loop");
                return true;
            case transport::RecvStatus::Error:
                LOG_ERROR("transport receive failed");
                return false;
        }
    }
    return true;
}

void StreamReceiver::stop()
{
    stop_.store(true);
    tx_.close();
}

bool StreamReceiver::on_datagram(const transport::Datagram &d)
{
    return on_datagram(d, stamp::now_ns());
}

bool StreamReceiver::on_datagram(const transport::Datagram &d, std::uint64_t now_ns)
{
    stats_.datagrams++;
    if (auto j = jitter_.on_arrival(now_ns))
    {
        LOG_INFO("jitter %.0f ns (avg inter-arrival %.0f ns)", j->jitter_ns,
                 j->mean_interval_ns);
    }

    // malformed or stale datagrams are noise: counted inside the reassembler
    auto done = rx_.feed_datagram(d);
    if (!done)
        return true;
    return deliver(std::move(*done), now_ns);
}

bool StreamReceiver::deliver(frag::Completed done, std::uint64_t now_ns)
{
    const auto                aad = frame_aad(done.frame_id);
    std::vector<std::uint8_t> plain;
    if (!aead_.open(done.payload, aad.data(), aad.size(), plain))
    {
        stats_.auth_failures++;
        LOG_WARN("[SEC] AEAD open failed (frame=%u, key mismatch or tampering), dropping frame",
                 done.frame_id);
        return true;
    }

    auto s = stamp::unwrap(std::move(plain));
    if (!s)
    {
        LOG_WARN("frame %u too short for a timestamp, dropping", done.frame_id);
        return true;
    }

    ReceivedFrame f;
    f.frame_id     = done.frame_id;
    f.send_time_ns = s->send_time_ns;
    f.recv_time_ns = now_ns;
    f.jpeg         = std::move(s->body);
    stats_.frames_delivered++;

    const double delay_ms =
        (static_cast<double>(now_ns) - static_cast<double>(f.send_time_ns)) / 1e6;
    LOG_DEBUG("frame %u: %zu bytes, delay %.2f ms", f.frame_id, f.jpeg.size(), delay_ms);
    if (auto fps = rate_.tick(now_ns))
    {
        const auto &rs = rx_.stats();
        LOG_INFO("receiver throughput %.2f frames/sec (delay %.2f ms, superseded=%llu "
                 "malformed=%llu stale=%llu oversize=%llu auth_fail=%llu)",
                 *fps, delay_ms, (unsigned long long)rs.superseded,
                 (unsigned long long)rs.dropped_malformed, (unsigned long long)rs.dropped_stale,
                 (unsigned long long)rs.dropped_oversize, (unsigned long long)stats_.auth_failures);
    }

    if (on_frame_ && !on_frame_(f))
    {
        LOG_INFO("frame handler requested stop");
        return false;
    }
    return true;
}

}  // namespace app
