#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "transport/itransport.hpp"

namespace transport
{

// In-process datagram queue; what is sent is received in the same order.
class LoopbackTransport final : public ITransport
{
  public:
    explicit LoopbackTransport(std::size_t capacity = 4096) : capacity_(capacity) {}

    bool        open(const Settings &s) override;
    bool        send(const Datagram &one_datagram) override;
    RecvStatus  receive(Datagram &out) override;
    void        close() override;
    std::string name() const override { return "loopback"; }

    std::size_t pending() const;
    std::size_t dropped() const;

  private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Datagram>    queue_;
    std::size_t             capacity_;
    std::size_t             max_datagram_{0};
    std::size_t             dropped_{0};
    bool                    open_{false};
};

}  // namespace transport
