#include "aqwave/command_session.hpp"
#include "aqwave/errors.hpp"
#include "aqwave/frame_codec.hpp"
#include "hardware/transport.hpp"

#include <cstring>

namespace aqwave {

CommandSession::CommandSession(Transport& transport)
    : transport_(transport)
{
    std::memset(packet_buf_, 0, sizeof(packet_buf_));
}

void CommandSession::send_command(Cmd cmd) {
    auto frame = encode_command(cmd);
    transport_.write(frame.data(), frame.size());
}

void CommandSession::read_exact(uint8_t* buf, size_t len) {
    size_t got = transport_.read(buf, len);
    if (got != len) {
        throw TransportTimeout(len, got);
    }
}

DecodedPacket CommandSession::read_packet(size_t len) {
    // Length is checked before touching the buffer so an oversized request
    // surfaces as the codec's framing error
    if (len < MIN_PACKET_LEN || len > MAX_PACKET_LEN) {
        throw ContractViolation(len);
    }
    read_exact(packet_buf_, len);
    return decode(packet_buf_, len);
}

DecodedPacket CommandSession::read_packet(size_t len, PacketType expected) {
    DecodedPacket pkt = read_packet(len);
    if (!pkt.type_is(expected)) {
        throw UnexpectedPacketType(static_cast<uint8_t>(expected), pkt.type);
    }
    return pkt;
}

DecodedPacket CommandSession::query(Cmd cmd, PacketType expected, size_t response_len) {
    send_command(cmd);
    return read_packet(response_len, expected);
}

std::vector<std::string> CommandSession::query_strings(Cmd cmd, PacketType expected,
                                                       size_t packet_len, int packet_count) {
    send_command(cmd);

    std::vector<std::string> out;
    out.reserve(packet_count > 0 ? static_cast<size_t>(packet_count) : 0);
    for (int i = 0; i < packet_count; ++i) {
        out.push_back(payload_to_string(read_packet(packet_len, expected)));
    }
    return out;
}

std::string CommandSession::query_string(Cmd cmd, PacketType expected, size_t packet_len) {
    return query_strings(cmd, expected, packet_len, 1).front();
}

size_t CommandSession::drain(size_t max_bytes) {
    std::vector<uint8_t> junk(max_bytes);
    size_t got = transport_.read(junk.data(), junk.size());
    transport_.reset_input_buffer();
    return got;
}

} // namespace aqwave
