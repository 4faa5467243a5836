#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "util/constants.hpp"

namespace stats
{

// Counts events and reports a per-second rate once a full window has elapsed.
class RateMeter
{
  public:
    explicit RateMeter(std::uint64_t window_ns = 1'000'000'000ULL) : window_ns_(window_ns) {}

    // Returns events/sec when the window closes, then starts a new window.
    std::optional<double> tick(std::uint64_t now_ns);

  private:
    std::uint64_t window_ns_;
    std::uint64_t start_ns_ = 0;
    std::uint64_t count_    = 0;
    bool          started_  = false;
};

struct JitterReport
{
    double mean_interval_ns = 0;  // average inter-arrival time
    double jitter_ns        = 0;  // mean absolute deviation from that average
};

// Inter-arrival jitter over fixed-size batches of arrivals.
class JitterTracker
{
  public:
    explicit JitterTracker(std::size_t interval = constants::JITTER_REPORT_INTERVAL)
        : interval_(interval)
    {
    }

    std::optional<JitterReport> on_arrival(std::uint64_t now_ns);

  private:
    std::size_t                interval_;
    std::optional<std::uint64_t> last_ns_;
    std::vector<std::uint64_t> gaps_;
};

}  // namespace stats
