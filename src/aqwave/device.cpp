#include "aqwave/device.hpp"
#include "aqwave/codes.hpp"
#include "aqwave/errors.hpp"
#include "aqwave/frame_codec.hpp"
#include "hardware/transport.hpp"

#include <utility>
#include <vector>

namespace aqwave {

namespace {

// Widen the transport timeout for one scope, restore it on every exit path
class ScopedTimeout {
public:
    ScopedTimeout(Transport& t, double timeout_sec)
        : transport_(t), saved_(t.timeout())
    {
        transport_.set_timeout(timeout_sec);
    }
    ~ScopedTimeout() { transport_.set_timeout(saved_); }

    ScopedTimeout(const ScopedTimeout&) = delete;
    ScopedTimeout& operator=(const ScopedTimeout&) = delete;

private:
    Transport& transport_;
    double saved_;
};

uint32_t payload_byte(const DecodedPacket& pkt, size_t idx) {
    return pkt.wire_byte(idx);
}

} // namespace

AQWaveDevice::AQWaveDevice(Transport& transport)
    : session_(transport)
{
}

DeviceInfo AQWaveDevice::get_info() {
    DeviceInfo info;

    auto device = session_.query_strings(Cmd::INFO_DEVICE, PacketType::INFO_DEVICE,
                                         STRING_PACKET_LEN, 2);
    info.device  = device[0];
    info.product = device[1];

    info.manufacturer = session_.query_string(Cmd::INFO_MANUFACTURER, PacketType::INFO_MANUFACTURER);
    info.user_id_1    = session_.query_string(Cmd::INFO_USER_1, PacketType::INFO_USER_1);
    info.user_id_2    = session_.query_string(Cmd::INFO_USER_2, PacketType::INFO_USER_2);
    return info;
}

uint32_t AQWaveDevice::get_recording_counter() {
    DecodedPacket pkt = session_.query(Cmd::RECORDING_INFO, PacketType::RECORDING_INFO,
                                       RECORDING_INFO_LEN);

    // Little-endian field in payload bytes 2..5, taken as raw wire bytes so a
    // cleared sign-mask bit does not shift them by 128. Whether the device really uses all
    // 32 bits is unverified; a full day needs only 18 (24*60*60*2 = 172800).
    uint32_t raw = payload_byte(pkt, 2)
                 | payload_byte(pkt, 3) << 8
                 | payload_byte(pkt, 4) << 16
                 | payload_byte(pkt, 5) << 24;
    return raw >> 1;
}

RecordingSettings AQWaveDevice::get_recording_time() {
    // First packet carries nothing, but its type still has to match
    session_.query(Cmd::RECORDING_SETTINGS, PacketType::RECORDING_SETTINGS_1,
                   RECORDING_SETTINGS_LEN);

    DecodedPacket pkt = session_.read_packet(RECORDING_SETTINGS_LEN,
                                             PacketType::RECORDING_SETTINGS_2);
    return RecordingSettings{pkt.values[2], pkt.values[3]};
}

bool AQWaveDevice::is_recording() {
    session_.send_command(Cmd::RECORDING_DATA);

    DecodedPacket pkt;
    try {
        pkt = session_.read_packet(PROBE_READ_LEN);
    } catch (...) {
        // Cancel the dump before reporting, or it floods the next exchange
        session_.send_command(Cmd::ABORT_SEND_DATA);
        session_.drain(ABORT_DRAIN_LEN);
        throw;
    }

    // The number of bytes sent before the abort takes effect is unknown
    // (14 or 22 in tests), so flush instead of waiting for an OK packet
    session_.send_command(Cmd::ABORT_SEND_DATA);
    session_.drain(ABORT_DRAIN_LEN);

    return pkt.type_is(RECORDING_BUSY_TYPE);
}

RecordedData AQWaveDevice::recorded_data() {
    const uint32_t count = get_recording_counter();
    const size_t packages = (count + SAMPLES_PER_PACKAGE - 1) / SAMPLES_PER_PACKAGE;

    RecordedData out;
    if (count == 0) return out;

    out.heart_rate.reserve(packages * SAMPLES_PER_PACKAGE);
    out.spo2.reserve(packages * SAMPLES_PER_PACKAGE);

    session_.send_command(Cmd::RECORDING_DATA);

    std::vector<uint8_t> raw(packages * RECORDING_PACKAGE_LEN);
    {
        ScopedTimeout widen(session_.transport(), BULK_TIMEOUT_SEC);
        session_.read_exact(raw.data(), raw.size());
    }

    for (size_t p = 0; p < packages; ++p) {
        DecodedPacket pkt = decode(raw.data() + p * RECORDING_PACKAGE_LEN, RECORDING_PACKAGE_LEN);
        if (!pkt.type_is(PacketType::RECORDING_DATA)) {
            throw UnexpectedPacketType(static_cast<uint8_t>(PacketType::RECORDING_DATA), pkt.type);
        }
        // Pairs are interleaved as (SpO2, HR) x 3
        out.heart_rate.push_back(pkt.values[1]);
        out.heart_rate.push_back(pkt.values[3]);
        out.heart_rate.push_back(pkt.values[5]);
        out.spo2.push_back(pkt.values[0]);
        out.spo2.push_back(pkt.values[2]);
        out.spo2.push_back(pkt.values[4]);
    }

    // Last package may carry one or two unused slots
    out.heart_rate.resize(count);
    out.spo2.resize(count);
    return out;
}

DataStream AQWaveDevice::data(int n, DataStream::WarningHandler on_warning) {
    return DataStream(session_, n, std::move(on_warning));
}

} // namespace aqwave
