#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Network defaults
inline constexpr std::uint16_t    DEFAULT_PORT        = 5005;
inline constexpr std::string_view DEFAULT_MCAST_GROUP = "239.1.2.3";
inline constexpr std::string_view DEFAULT_BIND_ADDR   = "0.0.0.0";
inline constexpr int              DEFAULT_MCAST_TTL   = 1;  // local subnet only

// 1500B Ethernet MTU - 20B IPv4 - 8B UDP
inline constexpr std::size_t DEFAULT_MAX_DATAGRAM = 1472;
// largest UDP payload over IPv4
inline constexpr std::size_t MAX_UDP_PAYLOAD = 65507;

// Media defaults
inline constexpr int DEFAULT_JPEG_QUALITY = 90;
inline constexpr int DEFAULT_CAMERA_INDEX = 0;

// Key file
inline constexpr std::string_view DEFAULT_KEY_PATH = "secret.key";
inline constexpr const char      *ENV_KEY_PATH     = "FRAMECAST_KEY";

// Stats
inline constexpr std::size_t JITTER_REPORT_INTERVAL = 100;  // datagrams per report

}  // namespace constants
