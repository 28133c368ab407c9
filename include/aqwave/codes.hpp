#pragma once

#include <cstddef>
#include <cstdint>

namespace aqwave {

// AQWave RX101 command opcodes (third byte of every command frame)
enum class Cmd : uint8_t {
    START              = 0xA1,
    STOP               = 0xA2,
    RECORDING_INFO     = 0xA4,
    RECORDING_SETTINGS = 0xA5,
    RECORDING_DATA     = 0xA6,
    ABORT_SEND_DATA    = 0xA7,
    INFO_DEVICE        = 0xA8,
    INFO_MANUFACTURER  = 0xA9,
    INFO_USER_1        = 0xAA,
    INFO_USER_2        = 0xAB,
    KEEP_ALIVE         = 0xAF,
};

// Response packet type tags (first byte of every packet)
enum class PacketType : uint8_t {
    DATA                 = 0x01,
    INFO_DEVICE          = 0x02,
    INFO_MANUFACTURER    = 0x03,
    INFO_USER_1          = 0x04,
    INFO_USER_2          = 0x05,
    RECORDING_SETTINGS_1 = 0x07,  // payload is all zero on every device seen so far
    RECORDING_INFO       = 0x08,
    UNKNOWN              = 0x0B,
    OK                   = 0x0C,
    RECORDING_DATA       = 0x0F,
    RECORDING_SETTINGS_2 = 0x12,  // recording start time: value[2]=hour, value[3]=minute
};

// RECORDING_DATA answered with UNKNOWN means the device is busy recording.
// Observed behaviour only, not documented by the vendor.
constexpr PacketType RECORDING_BUSY_TYPE = PacketType::UNKNOWN;

// Command frame: [0x7D][0x81][opcode]. The vendor tool pads to 9 bytes with
// 0x80, the device accepts the short form.
constexpr uint8_t FRAME_HEADER_0 = 0x7D;
constexpr uint8_t FRAME_HEADER_1 = 0x81;
constexpr size_t  COMMAND_FRAME_LEN = 3;

// Packet: [type][sign mask][payload 0..7]
constexpr size_t MIN_PACKET_LEN = 2;
constexpr size_t MAX_PACKET_LEN = 9;

// Response sizes per exchange
constexpr size_t STRING_PACKET_LEN      = 9;
constexpr size_t RECORDING_INFO_LEN     = 8;
constexpr size_t RECORDING_SETTINGS_LEN = 8;
constexpr size_t RECORDING_PACKAGE_LEN  = 8;
constexpr size_t DATA_PACKET_LEN        = 9;
constexpr size_t STOP_ACK_LEN           = 2;
constexpr size_t PROBE_READ_LEN         = 4;

// Abort acknowledgment is not deterministically sized (14 or 22 bytes seen)
constexpr size_t ABORT_DRAIN_LEN = 64;

// Each recording package holds up to three (SpO2, HR) pairs
constexpr int SAMPLES_PER_PACKAGE = 3;

// Keepalive every 60 samples (~1 s at the device's 60 Hz stream rate)
constexpr int KEEPALIVE_INTERVAL = 60;

// Serial line: 115200 8N1, 2 s read/write timeout
constexpr int    SERIAL_BAUD         = 115200;
constexpr double DEFAULT_TIMEOUT_SEC = 2.0;

// A full day (86400 pairs, 28800 packages, 230400 bytes) takes ~25 s
constexpr double BULK_TIMEOUT_SEC = 30.0;

} // namespace aqwave
