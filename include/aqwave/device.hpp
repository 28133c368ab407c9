#pragma once

#include "acquisition/data_stream.hpp"
#include "aqwave/command_session.hpp"
#include "aqwave/types.hpp"

#include <cstdint>

namespace aqwave {

class Transport;

// ReFleX Wireless AQWave RX101 PPG recorder.
// Every query is a fixed sequence of CommandSession exchanges and is
// all-or-nothing: any mismatch throws, no partial results, no retries.
// Owns the session, not the transport. One query or stream at a time.
class AQWaveDevice {
public:
    explicit AQWaveDevice(Transport& transport);

    AQWaveDevice(const AQWaveDevice&) = delete;
    AQWaveDevice& operator=(const AQWaveDevice&) = delete;

    // Device + product (two INFO_DEVICE packets), manufacturer, user ids
    DeviceInfo get_info();

    // Number of stored (SpO2, HR) pairs, i.e. seconds of recording.
    // The raw field counts both values, hence the shift by one.
    uint32_t get_recording_counter();

    // Start time of the stored recording (two-packet RECORDING_SETTINGS)
    RecordingSettings get_recording_time();

    // Ask with RECORDING_DATA: the device answers UNKNOWN while recording.
    // Aborts the dump and flushes the line afterwards, so this can take up to
    // one transport timeout.
    bool is_recording();

    // Download the stored recording. Blocks the device for the duration
    // (~25 s for a full day); the transport timeout is widened for the one
    // bulk read and restored afterwards.
    RecordedData recorded_data();

    // Live stream of n samples. See DataStream for the stop guarantee.
    DataStream data(int n, DataStream::WarningHandler on_warning = nullptr);

    CommandSession& session() { return session_; }

private:
    CommandSession session_;
};

} // namespace aqwave
