#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "crypto/psk_aead.hpp"
#include "transport/itransport.hpp"

namespace app
{

struct SenderStats
{
    std::uint64_t frames_sent    = 0;
    std::uint64_t frames_dropped = 0;  // seal, oversize or send failure
    std::uint64_t datagrams_sent = 0;
};

// stamp -> seal -> fragment -> send, one frame per call
class StreamSender
{
  public:
    StreamSender(transport::ITransport &t,
                 aead::PskAead         &aead,
                 std::size_t            max_chunk_payload,
                 std::uint32_t          first_frame_id);

    // Returns false when the frame was dropped; the caller keeps capturing.
    bool send_frame(const std::vector<std::uint8_t> &jpeg);
    bool send_frame(const std::vector<std::uint8_t> &jpeg, std::uint64_t send_time_ns);

    std::uint32_t      next_frame_id() const { return next_id_; }
    const SenderStats &stats() const { return stats_; }

  private:
    transport::ITransport &tx_;
    aead::PskAead         &aead_;
    std::size_t            max_chunk_payload_;
    std::uint32_t          next_id_;
    SenderStats            stats_;
};

// Random starting id, so a restarted sender does not land in the receiver's stale window
std::uint32_t random_frame_id();

}  // namespace app
