#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>

#include "crypto/psk_aead.hpp"
#include "proto/frag.hpp"
#include "transport/itransport.hpp"
#include "util/stats.hpp"

namespace app
{

struct ReceivedFrame
{
    std::uint32_t             frame_id{0};
    std::uint64_t             send_time_ns{0};
    std::uint64_t             recv_time_ns{0};
    std::vector<std::uint8_t> jpeg;
};

// Return false to stop the receive loop.
using FrameHandler = std::function<bool(const ReceivedFrame &)>;

struct ReceiverStats
{
    std::uint64_t datagrams        = 0;
    std::uint64_t frames_delivered = 0;
    std::uint64_t auth_failures    = 0;
};

// receive -> parse -> reassemble -> open -> handler. Everything runs on the
// thread calling run() / on_datagram(); only stop() may come from elsewhere.
class StreamReceiver
{
  public:
    StreamReceiver(transport::ITransport &t,
                   aead::PskAead         &aead,
                   FrameHandler           on_frame,
                   std::uint32_t          stale_window    = frag::DEFAULT_STALE_WINDOW,
                   std::size_t            max_frame_bytes = frag::DEFAULT_MAX_FRAME_BYTES);

    // Blocks until stop(), transport close, a transport error or the handler asks to stop.
    // Returns false only on a transport error.
    bool run();
    void stop();

    // Handles one datagram; returns false if the handler asked to stop.
    bool on_datagram(const transport::Datagram &d);
    bool on_datagram(const transport::Datagram &d, std::uint64_t now_ns);

    const ReceiverStats         &stats() const { return stats_; }
    const frag::ReassemblyStats &reassembly_stats() const { return rx_.stats(); }

  private:
    bool deliver(frag::Completed done, std::uint64_t now_ns);

    transport::ITransport &tx_;
    aead::PskAead         &aead_;
    FrameHandler           on_frame_;
    frag::Reassembler      rx_;
    stats::JitterTracker   jitter_;
    stats::RateMeter       rate_;
    ReceiverStats          stats_;
    std::atomic<bool>      stop_{false};
};

}  // namespace app
