#include <sodium.h>

#include "app/frame_aad.hpp"
#include "app/stream_sender.hpp"
#include "proto/frag.hpp"
#include "proto/stamp.hpp"
#include "util/log.hpp"

namespace app
{

std::uint32_t random_frame_id()
{
    aead::ensure_sodium_init();
    return randombytes_random();
}

StreamSender::StreamSender(transport::ITransport &t,
                           aead::PskAead         &aead,
                           std::size_t            max_chunk_payload,
                           std::uint32_t          first_frame_id)
    : tx_(t), aead_(aead), max_chunk_payload_(max_chunk_payload), next_id_(first_frame_id)
{
}

bool StreamSender::send_frame(const std::vector<std::uint8_t> &jpeg)
{
    return send_frame(jpeg, stamp::now_ns());
}

bool StreamSender::send_frame(const std::vector<std::uint8_t> &jpeg, std::uint64_t send_time_ns)
{
    // ids advance even for dropped frames; wraps at 2^32
    const std::uint32_t frame_id = next_id_++;

    // 1) Encrypt
    const auto                aad = frame_aad(frame_id);
    std::vector<std::uint8_t> sealed;
    if (!aead_.seal(stamp::wrap(send_time_ns, jpeg), aad.data(), aad.size(), sealed))
    {
        LOG_ERROR("send_frame: AEAD seal failed (frame=%u)", frame_id);
        stats_.frames_dropped++;
        return false;
    }

    // 2) Make chunks
    auto chunks = frag::make_chunks(frame_id, sealed, max_chunk_payload_);
    if (chunks.empty())
    {
        LOG_ERROR("send_frame: dropping frame %u (%zu bytes sealed)", frame_id, sealed.size());
        stats_.frames_dropped++;
        return false;
    }

    // 3) Send
    for (const auto &ch : chunks)
    {
        auto datagram = frag::serialize(ch);
        if (datagram.empty())
        {
            LOG_ERROR("send_frame: serialize failed (frame=%u seq=%u)", frame_id,
                      static_cast<unsigned>(ch.hdr.seq));
            stats_.frames_dropped++;
            return false;
        }
        if (!tx_.send(datagram))
        {
            // the rest of this frame is useless to the receiver
            LOG_WARN("send_frame: transport send failed (frame=%u seq=%u/%u)", frame_id,
                     static_cast<unsigned>(ch.hdr.seq), static_cast<unsigned>(ch.hdr.total));
            stats_.frames_dropped++;
            return false;
        }
        stats_.datagrams_sent++;
    }
    stats_.frames_sent++;
    LOG_DEBUG("send_frame: frame %u sent in %zu datagrams", frame_id, chunks.size());
    return true;
}

}  // namespace app
