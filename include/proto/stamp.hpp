#pragma once
#include <cstdint>
#include <optional>
#include <vector>

// Plaintext layout handed to the envelope: [send_time_ns u64 BE][jpeg bytes]
namespace stamp
{

inline constexpr std::size_t STAMP_SIZE = 8;

struct Stamped
{
    std::uint64_t             send_time_ns{0};
    std::vector<std::uint8_t> body;
};

std::vector<std::uint8_t> wrap(std::uint64_t send_time_ns, const std::vector<std::uint8_t> &body);
std::optional<Stamped>    unwrap(std::vector<std::uint8_t> plain);

std::uint64_t now_ns();

}  // namespace stamp
