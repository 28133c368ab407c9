#include "aqwave/frame_codec.hpp"
#include "aqwave/errors.hpp"

namespace aqwave {

std::array<uint8_t, COMMAND_FRAME_LEN> encode_command(Cmd cmd) {
    return {FRAME_HEADER_0, FRAME_HEADER_1, static_cast<uint8_t>(cmd)};
}

DecodedPacket decode(const uint8_t* data, size_t len) {
    if (len < MIN_PACKET_LEN || len > MAX_PACKET_LEN) {
        throw ContractViolation(len);
    }

    DecodedPacket out;
    out.type = data[0];
    const uint8_t sign_mask = data[1];
    out.sign_mask = sign_mask;

    const size_t payload_len = len - 2;
    out.values.reserve(payload_len);
    for (size_t i = 0; i < payload_len; ++i) {
        int v = data[2 + i];
        if ((sign_mask & (1u << i)) == 0) {
            v -= 128;
        }
        out.values.push_back(v);
    }
    return out;
}

DecodedPacket decode(const std::vector<uint8_t>& packet) {
    return decode(packet.data(), packet.size());
}

std::string payload_to_string(const DecodedPacket& packet) {
    std::string s;
    s.reserve(packet.values.size());
    for (int v : packet.values) {
        if (v != 0) {
            s.push_back(static_cast<char>(v));
        }
    }
    return s;
}

const char* packet_type_name(uint8_t type) {
    switch (static_cast<PacketType>(type)) {
        case PacketType::DATA:                 return "DATA";
        case PacketType::INFO_DEVICE:          return "INFO_DEVICE";
        case PacketType::INFO_MANUFACTURER:    return "INFO_MANUFACTURER";
        case PacketType::INFO_USER_1:          return "INFO_USER_1";
        case PacketType::INFO_USER_2:          return "INFO_USER_2";
        case PacketType::RECORDING_SETTINGS_1: return "RECORDING_SETTINGS_1";
        case PacketType::RECORDING_INFO:       return "RECORDING_INFO";
        case PacketType::UNKNOWN:              return "UNKNOWN";
        case PacketType::OK:                   return "OK";
        case PacketType::RECORDING_DATA:       return "RECORDING_DATA";
        case PacketType::RECORDING_SETTINGS_2: return "RECORDING_SETTINGS_2";
    }
    return "?";
}

const char* command_name(Cmd cmd) {
    switch (cmd) {
        case Cmd::START:              return "START";
        case Cmd::STOP:               return "STOP";
        case Cmd::RECORDING_INFO:     return "RECORDING_INFO";
        case Cmd::RECORDING_SETTINGS: return "RECORDING_SETTINGS";
        case Cmd::RECORDING_DATA:     return "RECORDING_DATA";
        case Cmd::ABORT_SEND_DATA:    return "ABORT_SEND_DATA";
        case Cmd::INFO_DEVICE:        return "INFO_DEVICE";
        case Cmd::INFO_MANUFACTURER:  return "INFO_MANUFACTURER";
        case Cmd::INFO_USER_1:        return "INFO_USER_1";
        case Cmd::INFO_USER_2:        return "INFO_USER_2";
        case Cmd::KEEP_ALIVE:         return "KEEP_ALIVE";
    }
    return "?";
}

} // namespace aqwave
