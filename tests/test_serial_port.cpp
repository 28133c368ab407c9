#include <gtest/gtest.h>

#include "aqwave/errors.hpp"
#include "hardware/serial_port.hpp"

#include <cstdint>
#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

namespace {

// Pseudo-terminal pair: the port opens the slave, the test plays the device
// on the master side
class PtyPair {
public:
    PtyPair() : master_(-1) {
        master_ = posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ >= 0 && (grantpt(master_) != 0 || unlockpt(master_) != 0)) {
            ::close(master_);
            master_ = -1;
        }
    }
    ~PtyPair() {
        if (master_ >= 0) ::close(master_);
    }

    bool ok() const { return master_ >= 0; }
    int master() const { return master_; }
    const char* slave_path() const { return ptsname(master_); }

private:
    int master_;
};

} // namespace

TEST(SerialPort, open_failure_reported_by_is_open) {
    aqwave::SerialPort port("/dev/nonexistent-aqwave-tty");
    EXPECT_FALSE(port.is_open());
    uint8_t b = 0;
    EXPECT_THROW(port.write(&b, 1), aqwave::TransportError);
}

TEST(SerialPort, unsupported_baud_rate_fails) {
    PtyPair pty;
    ASSERT_TRUE(pty.ok());

    aqwave::SerialPort bad(pty.slave_path(), 12345);
    EXPECT_FALSE(bad.is_open());

    aqwave::SerialPort good(pty.slave_path(), aqwave::SERIAL_BAUD);
    EXPECT_TRUE(good.is_open());
}

TEST(SerialPort, timed_read_returns_short) {
    PtyPair pty;
    ASSERT_TRUE(pty.ok());
    aqwave::SerialPort port(pty.slave_path(), aqwave::SERIAL_BAUD, 0.2);
    ASSERT_TRUE(port.is_open());

    const uint8_t ack[] = {0x0C, 0xFF};
    ASSERT_EQ(::write(pty.master(), ack, sizeof(ack)), 2);

    uint8_t buf[4] = {};
    EXPECT_EQ(port.read(buf, sizeof(buf)), 2u);
    EXPECT_EQ(buf[0], 0x0C);
    EXPECT_EQ(buf[1], 0xFF);
}
