#pragma once
#include <cstdint>
#include <optional>
#include <vector>

/*
TX:
StreamSender::send_frame(jpeg)
  -> stamp(send_time_ns, jpeg)
     -> AEAD.seal(..., aad = "FC1" || frame_id) = nonce + ciphertext + tag
        -> make_chunks(frame_id, bytes, max_chunk_payload)
           -> for each Chunk {hdr, payload}:
                serialize(Chunk)  // [12B header][payload]
                  -> transport.send(datagram)

RX:
transport.receive(datagram)
  -> parse(datagram)  // validate and extract Chunk [hdr, payload]
      -> ok? reassembler.feed(Chunk)
            -> Completed ? AEAD.open(..., aad = "FC1" || frame_id) -> unstamp -> sink
*/

namespace frag
{

// --- Protocol constants ---
inline constexpr std::uint8_t PROTO_VER   = 1;
inline constexpr std::uint8_t FLAG_FINAL  = 1 << 0;
inline constexpr std::size_t  HDR_SIZE    = 12;
inline constexpr std::size_t  MAX_PAYLOAD = 65507 - HDR_SIZE;  // one IPv4 UDP datagram

// Frames behind the newest started frame by less than this are stale.
inline constexpr std::uint32_t DEFAULT_STALE_WINDOW = 64;
// Receiver-side ceiling on one frame's buffered bytes (ciphertext + nonce + tag)
inline constexpr std::size_t DEFAULT_MAX_FRAME_BYTES = 16 * 1024 * 1024;

// On-wire chunk header, big-endian
struct Header
{
    std::uint8_t  ver{PROTO_VER};  // 1B
    std::uint8_t  flags{0};        // 1B
    std::uint32_t frame_id{0};     // 4B
    std::uint16_t seq{0};          // 2B
    std::uint16_t total{0};        // 2B
    std::uint16_t len{0};          // 2B
};

struct Chunk
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;
};

// TX
std::vector<Chunk>        make_chunks(std::uint32_t                    frame_id,
                                      const std::vector<std::uint8_t> &payload,
                                      std::size_t                      max_chunk_payload);
std::vector<std::uint8_t> serialize(const Chunk &c);
bool                      pack_header(const Header &in, std::uint8_t out[HDR_SIZE]);
// RX
std::optional<Chunk>      parse(const std::vector<std::uint8_t> &datagram);
bool                      unpack_header(const std::uint8_t in[HDR_SIZE], Header &out);

// Serial-number comparison over the 32-bit frame id space: true when b is
// ahead of a by less than half the space.
inline bool id_newer(std::uint32_t b, std::uint32_t a)
{
    return b != a && static_cast<std::uint32_t>(b - a) < 0x80000000u;
}

struct Completed
{
    std::uint32_t             frame_id{0};
    std::vector<std::uint8_t> payload;
};

struct ReassemblyStats
{
    std::uint64_t completed         = 0;
    std::uint64_t superseded        = 0;  // incomplete frames discarded for a newer one
    std::uint64_t dropped_malformed = 0;
    std::uint64_t dropped_stale     = 0;
    std::uint64_t dropped_oversize  = 0;  // frames abandoned past max_frame_bytes
    std::uint64_t duplicates        = 0;
};

// Holds at most one frame under construction. A chunk of a different,
// non-stale frame discards whatever is buffered. A frame whose chunks would
// buffer more than max_frame_bytes (or announce more chunks than could ever
// fit in it) is abandoned, and its remaining chunks are treated as stale.
class Reassembler
{
  public:
    explicit Reassembler(std::uint32_t stale_window    = DEFAULT_STALE_WINDOW,
                         std::size_t   max_frame_bytes = DEFAULT_MAX_FRAME_BYTES)
        : stale_window_(stale_window), max_frame_bytes_(max_frame_bytes)
    {
    }

    // Feed one chunk, return the complete encrypted payload if done
    std::optional<Completed> feed(const Chunk &c);
    // Parse and feed one raw datagram; malformed input is counted and dropped
    std::optional<Completed> feed_datagram(const std::vector<std::uint8_t> &datagram);

    void reset();

    bool                   has_active() const { return active_.has_value(); }
    std::uint32_t          active_id() const { return active_ ? active_->frame_id : 0; }
    const ReassemblyStats &stats() const { return stats_; }

  private:
    bool is_stale(std::uint32_t frame_id) const;
    void abandon(std::uint32_t frame_id);

    struct Slot
    {
        std::uint32_t                          frame_id = 0;
        std::uint16_t                          total    = 0;
        std::size_t                            received = 0;
        std::size_t                            bytes    = 0;
        std::vector<std::vector<std::uint8_t>> parts;  // size == total
        std::vector<bool>                      have;   // size == total
    };

    std::optional<Slot>          active_;
    std::optional<std::uint32_t> newest_id_;     // newest frame ever started
    std::optional<std::uint32_t> last_done_id_;  // last frame emitted or abandoned
    std::uint32_t                stale_window_;
    std::size_t                  max_frame_bytes_;
    ReassemblyStats              stats_;
};

}  // namespace frag
