#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "app/stream_receiver.hpp"
#include "app/stream_sender.hpp"
#include "crypto/psk_aead.hpp"
#include "proto/frag.hpp"
#include "transport/loopback_transport.hpp"

namespace
{
aead::Key test_key(std::uint8_t b = 0x5A)
{
    aead::Key k;
    k.fill(b);
    return k;
}

std::vector<std::uint8_t> fake_jpeg(std::size_t n, std::uint8_t seed)
{
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(i * 7 + seed);
    return v;
}

// Fails every send once `fail_after` datagrams went through
struct FlakyTransport : public transport::ITransport
{
    std::size_t                      fail_after = 0;
    std::size_t                      sent       = 0;
    std::vector<transport::Datagram> out;

    bool open(const transport::Settings &) override { return true; }
    bool send(const transport::Datagram &d) override
    {
        if (sent >= fail_after)
            return false;
        sent++;
        out.push_back(d);
        return true;
    }
    transport::RecvStatus receive(transport::Datagram &) override
    {
        return transport::RecvStatus::Closed;
    }
    void close() override {}
};

struct Collector
{
    std::vector<app::ReceivedFrame> frames;
    app::FrameHandler               handler()
    {
        return [this](const app::ReceivedFrame &f) {
            frames.push_back(f);
            return true;
        };
    }
};

// Pulls everything currently queued on the loopback link
std::vector<transport::Datagram> drain(transport::LoopbackTransport &t)
{
    std::vector<transport::Datagram> out;
    while (t.pending() > 0)
    {
        transport::Datagram d;
        if (t.receive(d) != transport::RecvStatus::Ok)
            break;
        out.push_back(std::move(d));
    }
    return out;
}
}  // namespace

TEST(StreamLoopback, FragmentedFrameRoundtrip)
{
    transport::LoopbackTransport link;
    transport::Settings          s{};
    s.max_datagram = 64 + frag::HDR_SIZE;
    ASSERT_TRUE(link.open(s));

    aead::SodiumPskAead sealer(test_key());
    aead::SodiumPskAead opener(test_key());
    app::StreamSender   sender(link, sealer, /*max_chunk_payload=*/64, /*first_frame_id=*/500);
    Collector           got;
    app::StreamReceiver receiver(link, opener, got.handler());

    const auto jpeg = fake_jpeg(4096, 3);
    ASSERT_TRUE(sender.send_frame(jpeg, /*send_time_ns=*/123456789));
    EXPECT_GT(sender.stats().datagrams_sent, 60u);

    for (const auto &d : drain(link))
        ASSERT_TRUE(receiver.on_datagram(d, 223456789));

    ASSERT_EQ(got.frames.size(), 1u);
    EXPECT_EQ(got.frames[0].frame_id, 500u);
    EXPECT_EQ(got.frames[0].jpeg, jpeg);
    EXPECT_EQ(got.frames[0].send_time_ns, 123456789u);
    EXPECT_EQ(got.frames[0].recv_time_ns, 223456789u);
    EXPECT_EQ(sender.next_frame_id(), 501u);
}

TEST(StreamLoopback, ReversedDatagramsStillDeliver)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(link, sealer, 100, 1);
    Collector           got;
    app::StreamReceiver receiver(link, sealer, got.handler());

    const auto jpeg = fake_jpeg(1000, 9);
    ASSERT_TRUE(sender.send_frame(jpeg));
    auto dgrams = drain(link);
    ASSERT_GT(dgrams.size(), 1u);
    for (auto it = dgrams.rbegin(); it != dgrams.rend(); ++it)
        receiver.on_datagram(*it);

    ASSERT_EQ(got.frames.size(), 1u);
    EXPECT_EQ(got.frames[0].jpeg, jpeg);
}

TEST(StreamLoopback, TamperedDatagramDropsFrame)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(link, sealer, 200, 10);
    Collector           got;
    app::StreamReceiver receiver(link, sealer, got.handler());

    ASSERT_TRUE(sender.send_frame(fake_jpeg(1000, 1)));
    auto dgrams = drain(link);
    ASSERT_GE(dgrams.size(), 2u);
    dgrams[1].back() ^= 0x80;  // flip a ciphertext bit, header intact
    for (const auto &d : dgrams)
        receiver.on_datagram(d);

    EXPECT_TRUE(got.frames.empty());
    EXPECT_EQ(receiver.stats().auth_failures, 1u);
    EXPECT_EQ(receiver.reassembly_stats().completed, 1u);

    // the stream carries on with the next frame
    const auto next = fake_jpeg(1000, 2);
    ASSERT_TRUE(sender.send_frame(next));
    for (const auto &d : drain(link))
        receiver.on_datagram(d);
    ASSERT_EQ(got.frames.size(), 1u);
    EXPECT_EQ(got.frames[0].jpeg, next);
}

TEST(StreamLoopback, WrongKeyNeverDelivers)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key(0x01));
    aead::SodiumPskAead opener(test_key(0x02));
    app::StreamSender   sender(link, sealer, 500, 1);
    Collector           got;
    app::StreamReceiver receiver(link, opener, got.handler());

    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(sender.send_frame(fake_jpeg(800, static_cast<std::uint8_t>(i))));
    for (const auto &d : drain(link))
        receiver.on_datagram(d);

    EXPECT_TRUE(got.frames.empty());
    EXPECT_EQ(receiver.stats().auth_failures, 3u);
}

TEST(StreamLoopback, LostChunkLosesOnlyThatFrame)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(link, sealer, 100, 7);
    Collector           got;
    app::StreamReceiver receiver(link, sealer, got.handler());

    ASSERT_TRUE(sender.send_frame(fake_jpeg(500, 1)));
    auto first = drain(link);
    first.pop_back();  // last chunk lost
    for (const auto &d : first)
        receiver.on_datagram(d);

    const auto second = fake_jpeg(500, 2);
    ASSERT_TRUE(sender.send_frame(second));
    for (const auto &d : drain(link))
        receiver.on_datagram(d);

    ASSERT_EQ(got.frames.size(), 1u);
    EXPECT_EQ(got.frames[0].frame_id, 8u);
    EXPECT_EQ(got.frames[0].jpeg, second);
    EXPECT_EQ(receiver.reassembly_stats().superseded, 1u);
}

TEST(StreamLoopback, FrameIdWrapsAround)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(link, sealer, 300, 0xFFFFFFFFu);
    Collector           got;
    app::StreamReceiver receiver(link, sealer, got.handler());

    ASSERT_TRUE(sender.send_frame(fake_jpeg(600, 1)));
    ASSERT_TRUE(sender.send_frame(fake_jpeg(600, 2)));
    EXPECT_EQ(sender.next_frame_id(), 1u);
    for (const auto &d : drain(link))
        receiver.on_datagram(d);

    ASSERT_EQ(got.frames.size(), 2u);
    EXPECT_EQ(got.frames[0].frame_id, 0xFFFFFFFFu);
    EXPECT_EQ(got.frames[1].frame_id, 0u);
}

TEST(StreamSender, OversizeFrameIsDroppedAndStreamContinues)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(link, sealer, /*max_chunk_payload=*/1, 0);

    // sealed size exceeds 65535 one-byte chunks
    EXPECT_FALSE(sender.send_frame(fake_jpeg(70000, 0)));
    EXPECT_EQ(sender.stats().frames_dropped, 1u);
    EXPECT_EQ(link.pending(), 0u);

    EXPECT_TRUE(sender.send_frame(fake_jpeg(10, 0)));
    EXPECT_EQ(sender.stats().frames_sent, 1u);
}

TEST(StreamSender, SendFailureAbandonsFrameOnly)
{
    FlakyTransport      flaky;
    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(flaky, sealer, 100, 0);

    flaky.fail_after = 3;
    EXPECT_FALSE(sender.send_frame(fake_jpeg(1000, 0)));
    EXPECT_EQ(flaky.out.size(), 3u);
    EXPECT_EQ(sender.stats().frames_dropped, 1u);

    // link recovers: next frame goes out whole
    flaky.fail_after = 1000;
    EXPECT_TRUE(sender.send_frame(fake_jpeg(1000, 1)));
    EXPECT_EQ(sender.stats().frames_sent, 1u);
    EXPECT_EQ(sender.next_frame_id(), 2u);
}

TEST(StreamReceiver, RunStopsWhenHandlerAsks)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(link, sealer, 256, 40);
    int                 seen = 0;
    app::StreamReceiver receiver(link, sealer, [&](const app::ReceivedFrame &) {
        return ++seen < 2;
    });

    for (int i = 0; i < 4; ++i)
        ASSERT_TRUE(sender.send_frame(fake_jpeg(700, static_cast<std::uint8_t>(i))));

    EXPECT_TRUE(receiver.run());
    EXPECT_EQ(seen, 2);
    EXPECT_GT(link.pending(), 0u);
}

TEST(StreamReceiver, RunEndsOnTransportClose)
{
    transport::LoopbackTransport link;
    ASSERT_TRUE(link.open(transport::Settings{}));

    aead::SodiumPskAead sealer(test_key());
    app::StreamSender   sender(link, sealer, 256, 40);
    Collector           got;
    app::StreamReceiver receiver(link, sealer, got.handler());

    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(sender.send_frame(fake_jpeg(700, static_cast<std::uint8_t>(i))));
    link.close();  // queued datagrams are still drained

    EXPECT_TRUE(receiver.run());
    EXPECT_EQ(got.frames.size(), 3u);
}
