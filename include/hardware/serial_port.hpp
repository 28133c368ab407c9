#pragma once

#include "aqwave/codes.hpp"
#include "hardware/transport.hpp"

#include <cstddef>
#include <cstdint>

namespace aqwave {

// Linux termios wrapper for the RX101 serial link.
// The USB-serial converter is a CP210x; the Bluetooth module (name "SpO2",
// PIN 7762) is wired to the same TX/RX lines, so only one can be used at a time.
// Raw mode, 8N1, no flow control. fd is non-blocking and every read/write
// is bounded by poll() against a deadline of timeout() seconds.
class SerialPort : public Transport {
public:
    // Open and configure the device. On failure is_open() is false.
    explicit SerialPort(const char* path, int baud = SERIAL_BAUD,
                        double timeout_sec = DEFAULT_TIMEOUT_SEC);
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    void write(const uint8_t* data, size_t len) override;
    size_t read(uint8_t* buf, size_t len) override;
    void reset_input_buffer() override;

    double timeout() const override { return timeout_sec_; }
    void set_timeout(double timeout_sec) override { timeout_sec_ = timeout_sec; }

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

private:
    bool configure(int baud);

    int fd_;
    double timeout_sec_;
};

} // namespace aqwave
