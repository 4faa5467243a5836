#include <algorithm>
#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstring>

#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

static Chunk chunk_of(std::uint32_t       frame_id,
                      std::uint16_t       seq,
                      std::uint16_t       total,
                      const std::uint8_t *data,
                      std::size_t         n)
{
    Chunk c;
    c.hdr.frame_id = frame_id;
    c.hdr.seq      = seq;
    c.hdr.total    = total;
    c.hdr.len      = static_cast<std::uint16_t>(n);
    c.hdr.flags    = (seq + 1 == total) ? FLAG_FINAL : 0;
    c.payload.assign(data, data + n);
    return c;
}

std::vector<Chunk> make_chunks(std::uint32_t                    frame_id,
                               const std::vector<std::uint8_t> &payload,
                               std::size_t                      max_chunk_payload)
{
    if (max_chunk_payload == 0 || max_chunk_payload > MAX_PAYLOAD)
    {
        LOG_ERROR("frame %u: chunk payload size %zu outside 1..%zu", frame_id,
                  max_chunk_payload, MAX_PAYLOAD);
        return {};
    }

    // an empty frame still travels as one (empty) final chunk
    const std::size_t total =
        payload.empty() ? 1 : (payload.size() + max_chunk_payload - 1) / max_chunk_payload;
    if (total > UINT16_MAX)
    {
        LOG_ERROR("frame %u: %zu bytes need %zu chunks of %zu, more than %u; dropping frame",
                  frame_id, payload.size(), total, max_chunk_payload,
                  static_cast<unsigned>(UINT16_MAX));
        return {};
    }

    std::vector<Chunk> out;
    out.reserve(total);
    for (std::size_t seq = 0, off = 0; seq < total; ++seq, off += max_chunk_payload)
    {
        const std::size_t n = std::min(max_chunk_payload, payload.size() - off);
        out.push_back(chunk_of(frame_id, static_cast<std::uint16_t>(seq),
                               static_cast<std::uint16_t>(total), payload.data() + off, n));
    }
    return out;
}

std::vector<std::uint8_t> serialize(const Chunk &c)
{
    std::vector<std::uint8_t> out(HDR_SIZE);
    if (c.payload.size() != c.hdr.len || !pack_header(c.hdr, out.data()))
    {
        LOG_ERROR("frame %u: cannot encode chunk %u/%u (len %u, %zu payload bytes)",
                  c.hdr.frame_id, static_cast<unsigned>(c.hdr.seq),
                  static_cast<unsigned>(c.hdr.total), static_cast<unsigned>(c.hdr.len),
                  c.payload.size());
        return {};
    }
    out.insert(out.end(), c.payload.begin(), c.payload.end());
    return out;
}

std::optional<Chunk> parse(const std::vector<std::uint8_t> &datagram)
{
    // stray or forged datagrams are expected on an open port: debug level only
    Header h{};
    if (datagram.size() < HDR_SIZE || !unpack_header(datagram.data(), h))
    {
        LOG_DEBUG("ignoring %zu-byte datagram: no valid chunk header", datagram.size());
        return std::nullopt;
    }
    if (datagram.size() - HDR_SIZE != h.len)
    {
        LOG_DEBUG("ignoring chunk %u/%u of frame %u: header says %u bytes, carries %zu",
                  static_cast<unsigned>(h.seq), static_cast<unsigned>(h.total), h.frame_id,
                  static_cast<unsigned>(h.len), datagram.size() - HDR_SIZE);
        return std::nullopt;
    }

    Chunk c;
    c.hdr = h;
    c.payload.assign(datagram.begin() + HDR_SIZE, datagram.end());
    return c;
}

static bool header_valid(const Header &h)
{
    if (h.ver != PROTO_VER)
        return false;
    if (h.total == 0)
        return false;
    if (h.seq >= h.total)
        return false;
    if (h.len > MAX_PAYLOAD)
        return false;
    return true;
}

bool pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    if (!header_valid(in))
        return false;

    out[0] = in.ver;
    out[1] = in.flags;

    std::uint32_t frame_id_be = htonl(in.frame_id);
    std::memcpy(out + 2, &frame_id_be, sizeof frame_id_be);

    std::uint16_t seq_be = htons(in.seq);
    std::memcpy(out + 6, &seq_be, sizeof seq_be);

    std::uint16_t total_be = htons(in.total);
    std::memcpy(out + 8, &total_be, sizeof total_be);

    std::uint16_t len_be = htons(in.len);
    std::memcpy(out + 10, &len_be, sizeof len_be);

    return true;
}

bool unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.ver   = in[0];
    out.flags = in[1];

    std::uint32_t frame_id_be;
    std::memcpy(&frame_id_be, in + 2, sizeof frame_id_be);
    out.frame_id = ntohl(frame_id_be);

    std::uint16_t seq_be;
    std::memcpy(&seq_be, in + 6, sizeof seq_be);
    out.seq = ntohs(seq_be);

    std::uint16_t total_be;
    std::memcpy(&total_be, in + 8, sizeof total_be);
    out.total = ntohs(total_be);

    std::uint16_t len_be;
    std::memcpy(&len_be, in + 10, sizeof len_be);
    out.len = ntohs(len_be);

    return header_valid(out);
}

bool Reassembler::is_stale(std::uint32_t frame_id) const
{
    if (last_done_id_ && *last_done_id_ == frame_id)
        return true;
    if (!newest_id_ || frame_id == *newest_id_)
        return false;
    if (id_newer(frame_id, *newest_id_))
        return false;
    // behind the newest frame: stale if close, a sender restart if far
    const std::uint32_t behind = *newest_id_ - frame_id;
    return behind < stale_window_;
}

std::optional<Completed> Reassembler::feed(const Chunk &c)
{
    if (c.hdr.total == 0 || c.hdr.seq >= c.hdr.total || c.hdr.len != c.payload.size())
    {
        LOG_DEBUG("Reassembler::feed: invalid chunk");
        stats_.dropped_malformed++;
        return std::nullopt;
    }
    const std::uint32_t frame_id = c.hdr.frame_id;
    if (is_stale(frame_id))
    {
        LOG_DEBUG("Reassembler::feed: stale chunk (frame=%u, newest=%u)", frame_id,
                  newest_id_.value_or(0));
        stats_.dropped_stale++;
        return std::nullopt;
    }

    if (!active_ || active_->frame_id != frame_id)
    {
        if (active_)
        {
            LOG_DEBUG("Reassembler::feed: frame %u superseded by %u (%zu/%u chunks)",
                      active_->frame_id, frame_id, active_->received,
                      static_cast<unsigned>(active_->total));
            stats_.superseded++;
        }
        if (c.hdr.total > 1 && c.hdr.total > max_frame_bytes_)
        {
            // every chunk of a multi-chunk frame carries at least one byte
            LOG_DEBUG("Reassembler::feed: frame %u announces %u chunks, over the %zu-byte cap",
                      frame_id, static_cast<unsigned>(c.hdr.total), max_frame_bytes_);
            abandon(frame_id);
            return std::nullopt;
        }
        Slot s;
        s.frame_id = frame_id;
        s.total    = c.hdr.total;
        s.parts.assign(s.total, {});
        s.have.assign(s.total, false);
        active_    = std::move(s);
        newest_id_ = frame_id;
    }

    Slot &st = *active_;
    if (st.total != c.hdr.total)
    {
        // first-seen total wins
        LOG_DEBUG("Reassembler::feed: conflicting total for frame %u (%u != %u)", frame_id,
                  static_cast<unsigned>(c.hdr.total), static_cast<unsigned>(st.total));
        stats_.dropped_malformed++;
        return std::nullopt;
    }

    const std::uint16_t seq = c.hdr.seq;
    if (st.have[seq])
    {
        stats_.duplicates++;
        return std::nullopt;
    }
    if (st.bytes + c.payload.size() > max_frame_bytes_)
    {
        LOG_DEBUG("Reassembler::feed: frame %u exceeds %zu bytes, abandoning", frame_id,
                  max_frame_bytes_);
        abandon(frame_id);
        return std::nullopt;
    }
    st.parts[seq] = c.payload;
    st.have[seq]  = true;
    st.received++;
    st.bytes += c.payload.size();

    if (st.received < st.total)
        return std::nullopt;  // not done yet

    Completed done;
    done.frame_id = frame_id;
    done.payload.reserve(st.bytes);
    for (const auto &part : st.parts)
        done.payload.insert(done.payload.end(), part.begin(), part.end());

    active_.reset();
    last_done_id_ = frame_id;
    stats_.completed++;
    return done;
}

std::optional<Completed> Reassembler::feed_datagram(const std::vector<std::uint8_t> &datagram)
{
    auto c = parse(datagram);
    if (!c)
    {
        stats_.dropped_malformed++;
        return std::nullopt;
    }
    return feed(*c);
}

void Reassembler::abandon(std::uint32_t frame_id)
{
    active_.reset();
    newest_id_    = frame_id;
    last_done_id_ = frame_id;
    stats_.dropped_oversize++;
}

void Reassembler::reset()
{
    active_.reset();
    newest_id_.reset();
    last_done_id_.reset();
}

}  // namespace frag
