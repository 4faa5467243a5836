#pragma once

namespace exitc
{
inline constexpr int ok              = 0;
inline constexpr int bad_args        = 2;
inline constexpr int key_error       = 3;
inline constexpr int transport_error = 4;
inline constexpr int media_error     = 5;
inline constexpr int runtime_error   = 6;
}  // namespace exitc
