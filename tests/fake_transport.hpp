#pragma once

#include "aqwave/codes.hpp"
#include "hardware/transport.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <initializer_list>
#include <vector>

namespace aqwave_test {

// Scripted device: queued bytes come back from read(), writes and reads are
// logged in order. A read with too few queued bytes returns short, the way
// a real port behaves on timeout.
class FakeTransport : public aqwave::Transport {
public:
    struct Event {
        enum Kind { WRITE, READ, RESET } kind;
        std::vector<uint8_t> bytes;  // WRITE: frame written
        size_t requested;            // READ: bytes asked for
        size_t returned;             // READ: bytes handed out
        double timeout;              // timeout in effect
    };

    void queue(const std::vector<uint8_t>& bytes) {
        rx_.insert(rx_.end(), bytes.begin(), bytes.end());
    }

    void write(const uint8_t* data, size_t len) override {
        events.push_back({Event::WRITE, std::vector<uint8_t>(data, data + len), 0, 0, timeout_});
    }

    size_t read(uint8_t* buf, size_t len) override {
        size_t n = std::min(len, rx_.size());
        std::copy(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(n), buf);
        rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(n));
        events.push_back({Event::READ, {}, len, n, timeout_});
        return n;
    }

    void reset_input_buffer() override {
        rx_.clear();
        events.push_back({Event::RESET, {}, 0, 0, timeout_});
    }

    double timeout() const override { return timeout_; }
    void set_timeout(double timeout_sec) override { timeout_ = timeout_sec; }

    // Opcodes of every command frame written, in order
    std::vector<aqwave::Cmd> commands() const {
        std::vector<aqwave::Cmd> out;
        for (const auto& e : events) {
            if (e.kind == Event::WRITE && e.bytes.size() == aqwave::COMMAND_FRAME_LEN) {
                out.push_back(static_cast<aqwave::Cmd>(e.bytes[2]));
            }
        }
        return out;
    }

    size_t count_command(aqwave::Cmd cmd) const {
        auto cmds = commands();
        return static_cast<size_t>(std::count(cmds.begin(), cmds.end(), cmd));
    }

    std::vector<size_t> read_sizes() const {
        std::vector<size_t> out;
        for (const auto& e : events) {
            if (e.kind == Event::READ) out.push_back(e.requested);
        }
        return out;
    }

    size_t count_resets() const {
        return static_cast<size_t>(std::count_if(events.begin(), events.end(),
            [](const Event& e) { return e.kind == Event::RESET; }));
    }

    size_t pending() const { return rx_.size(); }

    std::vector<Event> events;

private:
    std::deque<uint8_t> rx_;
    double timeout_ = aqwave::DEFAULT_TIMEOUT_SEC;
};

// [type][mask][payload...]
inline std::vector<uint8_t> packet(uint8_t type, uint8_t mask, std::initializer_list<uint8_t> payload) {
    std::vector<uint8_t> p{type, mask};
    p.insert(p.end(), payload.begin(), payload.end());
    return p;
}

inline std::vector<uint8_t> packet(aqwave::PacketType type, uint8_t mask,
                                   std::initializer_list<uint8_t> payload) {
    return packet(static_cast<uint8_t>(type), mask, payload);
}

// Text packet: all payload bytes unsigned, padded with zeros to 7 bytes
inline std::vector<uint8_t> string_packet(aqwave::PacketType type, const char* text) {
    std::vector<uint8_t> p{static_cast<uint8_t>(type), 0xFF};
    for (size_t i = 0; i < 7; ++i) {
        p.push_back(text[i] ? static_cast<uint8_t>(text[i]) : 0);
        if (!text[i]) {
            for (++i; i < 7; ++i) p.push_back(0);
            break;
        }
    }
    return p;
}

// Streamed DATA packet: pulse, ppg, ppg_alt, hr, spo2, 255, 255 (all unsigned)
inline std::vector<uint8_t> data_packet(uint8_t pulse, uint8_t ppg, uint8_t ppg_alt,
                                        uint8_t hr, uint8_t spo2) {
    return packet(aqwave::PacketType::DATA, 0xFF, {pulse, ppg, ppg_alt, hr, spo2, 255, 255});
}

inline std::vector<uint8_t> ok_ack() {
    return packet(aqwave::PacketType::OK, 0xFF, {});
}

} // namespace aqwave_test
