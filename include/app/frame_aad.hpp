#pragma once
#include <array>
#include <cstdint>

namespace app
{

// Associated data binding a sealed frame to its wire frame id: "FC1" || frame_id (BE)
using FrameAad = std::array<std::uint8_t, 7>;

inline FrameAad frame_aad(std::uint32_t frame_id)
{
    return {'F',
            'C',
            '1',
            static_cast<std::uint8_t>(frame_id >> 24),
            static_cast<std::uint8_t>(frame_id >> 16),
            static_cast<std::uint8_t>(frame_id >> 8),
            static_cast<std::uint8_t>(frame_id)};
}

}  // namespace app
