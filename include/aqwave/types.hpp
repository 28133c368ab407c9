#pragma once

#include "aqwave/codes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace aqwave {

// One decoded response packet. values[i] is payload byte i, either as-is
// (sign mask bit set) or reduced by 128 (bit clear).
struct DecodedPacket {
    uint8_t type = 0;
    uint8_t sign_mask = 0;
    std::vector<int> values;

    bool type_is(PacketType t) const { return type == static_cast<uint8_t>(t); }

    // Payload byte i exactly as it was on the wire, whatever its mask bit
    uint8_t wire_byte(size_t i) const {
        int v = values[i];
        if ((sign_mask & (1u << i)) == 0) v += 128;
        return static_cast<uint8_t>(v);
    }
};

// Identification strings, zero bytes stripped
struct DeviceInfo {
    std::string device;
    std::string product;
    std::string manufacturer;
    std::string user_id_1;
    std::string user_id_2;
};

// Time of day the stored recording was started
struct RecordingSettings {
    int hour;
    int minute;
};

// One streamed sample. timestamp is host wall-clock seconds at receipt,
// the device sends no time of its own.
// Must be trivially copyable for the SPSC ring buffer
struct DataSample {
    double timestamp;
    int    pulse;       // beat flag signal
    int    ppg;
    int    ppg_alt;     // second, lower-magnitude PPG channel
    int    heart_rate;
    int    spo2;
};
static_assert(std::is_trivially_copyable_v<DataSample>, "DataSample must be trivially copyable");

// Stored recording, one entry per second
struct RecordedData {
    std::vector<int> heart_rate;
    std::vector<int> spo2;
};

} // namespace aqwave
