#include <cmath>

#include "util/stats.hpp"

namespace stats
{

std::optional<double> RateMeter::tick(std::uint64_t now_ns)
{
    if (!started_)
    {
        started_  = true;
        start_ns_ = now_ns;
        count_    = 0;
        return std::nullopt;  // the first event only opens the window
    }
    count_++;

    const std::uint64_t elapsed = now_ns - start_ns_;
    if (elapsed < window_ns_)
        return std::nullopt;

    const double rate = static_cast<double>(count_) * 1e9 / static_cast<double>(elapsed);
    start_ns_         = now_ns;
    count_            = 0;
    return rate;
}

std::optional<JitterReport> JitterTracker::on_arrival(std::uint64_t now_ns)
{
    if (last_ns_)
        gaps_.push_back(now_ns >= *last_ns_ ? now_ns - *last_ns_ : 0);
    last_ns_ = now_ns;

    if (interval_ == 0 || gaps_.size() < interval_)
        return std::nullopt;

    double sum = 0;
    for (auto g : gaps_)
        sum += static_cast<double>(g);
    JitterReport r;
    r.mean_interval_ns = sum / static_cast<double>(gaps_.size());

    double dev = 0;
    for (auto g : gaps_)
        dev += std::fabs(static_cast<double>(g) - r.mean_interval_ns);
    r.jitter_ns = dev / static_cast<double>(gaps_.size());

    gaps_.clear();
    return r;
}

}  // namespace stats
