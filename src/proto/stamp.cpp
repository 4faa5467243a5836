#include <chrono>

#include "proto/stamp.hpp"

namespace stamp
{

std::vector<std::uint8_t> wrap(std::uint64_t send_time_ns, const std::vector<std::uint8_t> &body)
{
    std::vector<std::uint8_t> out;
    out.reserve(STAMP_SIZE + body.size());
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(static_cast<std::uint8_t>(send_time_ns >> shift));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

std::optional<Stamped> unwrap(std::vector<std::uint8_t> plain)
{
    if (plain.size() < STAMP_SIZE)
        return std::nullopt;
    Stamped s;
    for (std::size_t i = 0; i < STAMP_SIZE; i++)
        s.send_time_ns = (s.send_time_ns << 8) | plain[i];
    plain.erase(plain.begin(), plain.begin() + STAMP_SIZE);
    s.body = std::move(plain);
    return s;
}

std::uint64_t now_ns()
{
    using namespace std::chrono;
    return static_cast<std::uint64_t>(
        duration_cast<nanoseconds>(system_clock::now().time_since_epoch()).count());
}

}  // namespace stamp
