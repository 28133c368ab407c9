#include <gtest/gtest.h>

#include "acquisition/data_stream.hpp"
#include "aqwave/device.hpp"
#include "aqwave/errors.hpp"
#include "fake_transport.hpp"

#include <algorithm>
#include <vector>

using aqwave::Cmd;
using aqwave::PacketType;
using aqwave_test::FakeTransport;
using aqwave_test::data_packet;
using aqwave_test::ok_ack;
using aqwave_test::packet;

namespace {

void queue_samples(FakeTransport& t, int n) {
    for (int i = 0; i < n; ++i) {
        t.queue(data_packet(0, static_cast<uint8_t>(i & 0x7F), 21, 72, 98));
    }
}

// Number of 9-byte DATA reads completed before each KEEP_ALIVE write
std::vector<int> keepalive_positions(const FakeTransport& t) {
    std::vector<int> out;
    int reads = 0;
    for (const auto& e : t.events) {
        if (e.kind == FakeTransport::Event::READ && e.requested == aqwave::DATA_PACKET_LEN) {
            ++reads;
        } else if (e.kind == FakeTransport::Event::WRITE &&
                   e.bytes[2] == static_cast<uint8_t>(Cmd::KEEP_ALIVE)) {
            out.push_back(reads);
        }
    }
    return out;
}

} // namespace

TEST(DataStream, lazy_start) {
    FakeTransport t;
    aqwave::AQWaveDevice dev(t);
    {
        auto stream = dev.data(5);
        EXPECT_EQ(stream.state(), aqwave::DataStream::State::IDLE);
    }
    // Never iterated: nothing sent, nothing to stop
    EXPECT_TRUE(t.events.empty());
}

TEST(DataStream, full_run) {
    FakeTransport t;
    queue_samples(t, 3);
    t.queue(ok_ack());
    aqwave::AQWaveDevice dev(t);

    auto stream = dev.data(3);
    std::vector<aqwave::DataSample> got;
    for (const auto& s : stream) {
        got.push_back(s);
    }

    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0].pulse, 0);
    EXPECT_EQ(got[1].ppg, 1);
    EXPECT_EQ(got[2].ppg_alt, 21);
    EXPECT_EQ(got[2].heart_rate, 72);
    EXPECT_EQ(got[2].spo2, 98);
    EXPECT_GT(got[0].timestamp, 0.0);
    EXPECT_LE(got[0].timestamp, got[2].timestamp);

    EXPECT_EQ(t.commands(), (std::vector<Cmd>{Cmd::START, Cmd::STOP}));
    EXPECT_EQ(t.read_sizes(), (std::vector<size_t>{9, 9, 9, 2}));
    EXPECT_EQ(stream.state(), aqwave::DataStream::State::DONE);
    EXPECT_FALSE(stream.warning().has_value());
}

TEST(DataStream, keepalive_every_60_samples) {
    FakeTransport t;
    queue_samples(t, 125);
    t.queue(ok_ack());
    aqwave::AQWaveDevice dev(t);

    auto stream = dev.data(125);
    int count = 0;
    for (const auto& s : stream) {
        (void)s;
        ++count;
    }

    EXPECT_EQ(count, 125);
    EXPECT_EQ(t.count_command(Cmd::KEEP_ALIVE), 2u);
    EXPECT_EQ(keepalive_positions(t), (std::vector<int>{60, 120}));
    EXPECT_EQ(stream.keepalives_sent(), 2);
    EXPECT_EQ(t.commands().front(), Cmd::START);
    EXPECT_EQ(t.commands().back(), Cmd::STOP);
}

TEST(DataStream, cancellation_stops_once) {
    FakeTransport t;
    queue_samples(t, 10);
    t.queue(ok_ack());
    aqwave::AQWaveDevice dev(t);

    {
        auto stream = dev.data(125);
        int count = 0;
        for (const auto& s : stream) {
            (void)s;
            if (++count == 10) break;
        }
        EXPECT_EQ(stream.emitted(), 10);
        EXPECT_EQ(t.count_command(Cmd::STOP), 0u);
    }

    EXPECT_EQ(t.count_command(Cmd::STOP), 1u);
    EXPECT_EQ(t.count_command(Cmd::KEEP_ALIVE), 0u);
    auto sizes = t.read_sizes();
    EXPECT_EQ(std::count(sizes.begin(), sizes.end(), size_t{2}), 1);
    EXPECT_EQ(sizes.back(), 2u);
}

TEST(DataStream, explicit_finish_is_idempotent) {
    FakeTransport t;
    queue_samples(t, 2);
    t.queue(ok_ack());
    aqwave::AQWaveDevice dev(t);

    {
        auto stream = dev.data(50);
        aqwave::DataSample s;
        ASSERT_TRUE(stream.next(s));
        ASSERT_TRUE(stream.next(s));
        EXPECT_EQ(stream.state(), aqwave::DataStream::State::EMITTING);

        EXPECT_FALSE(stream.finish().has_value());
        EXPECT_FALSE(stream.finish().has_value());
        EXPECT_FALSE(stream.next(s));

        // Not restartable
        EXPECT_TRUE(stream.begin() == stream.end());
    }
    EXPECT_EQ(t.count_command(Cmd::STOP), 1u);
    EXPECT_EQ(t.count_command(Cmd::START), 1u);
}

TEST(DataStream, zero_samples_still_stops) {
    FakeTransport t;
    t.queue(ok_ack());
    aqwave::AQWaveDevice dev(t);

    auto stream = dev.data(0);
    aqwave::DataSample s;
    EXPECT_FALSE(stream.next(s));
    EXPECT_EQ(t.commands(), (std::vector<Cmd>{Cmd::START, Cmd::STOP}));
}

TEST(DataStream, wrong_type_stops_then_rethrows) {
    FakeTransport t;
    queue_samples(t, 4);
    t.queue(packet(PacketType::RECORDING_DATA, 0xFF, {1, 2, 3, 4, 5, 6, 7}));
    t.queue(ok_ack());
    aqwave::AQWaveDevice dev(t);

    auto stream = dev.data(10);
    int count = 0;
    try {
        for (const auto& s : stream) {
            (void)s;
            ++count;
        }
        FAIL() << "no exception";
    } catch (const aqwave::UnexpectedPacketType& e) {
        EXPECT_EQ(e.expected(), 0x01);
        EXPECT_EQ(e.actual(), 0x0F);
    }

    EXPECT_EQ(count, 4);
    EXPECT_EQ(t.count_command(Cmd::STOP), 1u);
    EXPECT_EQ(t.read_sizes().back(), 2u);
    EXPECT_EQ(stream.state(), aqwave::DataStream::State::DONE);
}

TEST(DataStream, timeout_stops_then_rethrows_original) {
    FakeTransport t;
    queue_samples(t, 1);
    aqwave::AQWaveDevice dev(t);

    // Second read comes up empty, and so does the stop acknowledgment:
    // the caller still sees the sample timeout, not the stop failure
    auto stream = dev.data(10);
    aqwave::DataSample s;
    ASSERT_TRUE(stream.next(s));
    try {
        stream.next(s);
        FAIL() << "no exception";
    } catch (const aqwave::TransportTimeout& e) {
        EXPECT_EQ(e.expected(), 9u);
    }
    EXPECT_EQ(t.count_command(Cmd::STOP), 1u);
}

TEST(DataStream, bad_stop_ack_is_a_warning) {
    FakeTransport t;
    queue_samples(t, 2);
    t.queue(packet(PacketType::DATA, 0xFF, {}));  // a stray DATA header instead of OK
    aqwave::AQWaveDevice dev(t);

    std::vector<aqwave::SoftAcknowledgmentMismatch> warnings;
    auto stream = dev.data(2, [&](const aqwave::SoftAcknowledgmentMismatch& w) {
        warnings.push_back(w);
    });

    int count = 0;
    for (const auto& s : stream) {
        (void)s;
        ++count;
    }

    EXPECT_EQ(count, 2);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].expected, 0x0C);
    EXPECT_EQ(warnings[0].actual, 0x01);
    ASSERT_TRUE(stream.warning().has_value());
    EXPECT_EQ(stream.warning()->actual, 0x01);
    EXPECT_EQ(stream.state(), aqwave::DataStream::State::DONE);
}

TEST(DataStream, finish_propagates_stop_failure) {
    FakeTransport t;
    queue_samples(t, 1);
    aqwave::AQWaveDevice dev(t);

    auto stream = dev.data(5);
    aqwave::DataSample s;
    ASSERT_TRUE(stream.next(s));
    EXPECT_THROW(stream.finish(), aqwave::TransportTimeout);
    EXPECT_EQ(stream.state(), aqwave::DataStream::State::DONE);
    EXPECT_NO_THROW(stream.finish());
}

TEST(DataStream, session_usable_after_stream) {
    FakeTransport t;
    queue_samples(t, 1);
    t.queue(ok_ack());
    aqwave::AQWaveDevice dev(t);

    {
        auto stream = dev.data(100);
        aqwave::DataSample s;
        ASSERT_TRUE(stream.next(s));
    }
    EXPECT_EQ(t.pending(), 0u);

    t.queue(packet(PacketType::RECORDING_INFO, 0xFF, {0, 0, 0x64, 0, 0, 0}));
    EXPECT_EQ(dev.get_recording_counter(), 50u);
    EXPECT_EQ(t.commands(), (std::vector<Cmd>{Cmd::START, Cmd::STOP, Cmd::RECORDING_INFO}));
}
