#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{

// LoopbackTransport: a fake link to test the pipeline (sender -> receiver) without sockets.
bool LoopbackTransport::open(const Settings &s)
{
    std::lock_guard<std::mutex> lock(mu_);
    max_datagram_ = s.max_datagram;
    queue_.clear();
    dropped_ = 0;
    open_    = true;
    return true;
}

bool LoopbackTransport::send(const Datagram &one_datagram)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (!open_)
        return false;
    if (max_datagram_ != 0 && one_datagram.size() > max_datagram_)
    {
        LOG_ERROR("datagram too large (%zu > %zu)", one_datagram.size(), max_datagram_);
        return false;
    }
    if (queue_.size() >= capacity_)
    {
        // a full queue behaves like a congested link: the datagram is lost
        dropped_++;
        return true;
    }
    queue_.push_back(one_datagram);
    cv_.notify_one();
    return true;
}

RecvStatus LoopbackTransport::receive(Datagram &out)
{
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return !queue_.empty() || !open_; });
    if (queue_.empty())
        return RecvStatus::Closed;
    out = std::move(queue_.front());
    queue_.pop_front();
    return RecvStatus::Ok;
}

void LoopbackTransport::close()
{
    std::lock_guard<std::mutex> lock(mu_);
    open_ = false;
    cv_.notify_all();
}

std::size_t LoopbackTransport::pending() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return queue_.size();
}

std::size_t LoopbackTransport::dropped() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return dropped_;
}

}  // namespace transport
