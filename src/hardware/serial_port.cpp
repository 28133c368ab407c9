#include "hardware/serial_port.hpp"
#include "aqwave/errors.hpp"

#include <cstdio>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <time.h>
#include <unistd.h>

namespace aqwave {

static double clock_monotonic() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec * 1e-9;
}

// termios speed constant, or false for a rate the driver has no constant for
static bool to_speed(int baud, speed_t& out) {
    switch (baud) {
        case 9600:   out = B9600;   return true;
        case 19200:  out = B19200;  return true;
        case 38400:  out = B38400;  return true;
        case 57600:  out = B57600;  return true;
        case 115200: out = B115200; return true;
        case 230400: out = B230400; return true;
        default:     return false;
    }
}

SerialPort::SerialPort(const char* path, int baud, double timeout_sec)
    : fd_(-1), timeout_sec_(timeout_sec)
{
    fd_ = ::open(path, O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd_ < 0) {
        std::perror(path);
        return;
    }

    if (!configure(baud)) {
        ::close(fd_);
        fd_ = -1;
        return;
    }

    // Drop whatever the device sent before we were listening
    ::tcflush(fd_, TCIOFLUSH);
}

SerialPort::~SerialPort() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

bool SerialPort::configure(int baud) {
    speed_t speed;
    if (!to_speed(baud, speed)) {
        std::fprintf(stderr, "  [SERIAL] Unsupported baud rate %d\n", baud);
        return false;
    }

    struct termios tty{};
    if (::tcgetattr(fd_, &tty) < 0) {
        std::perror("tcgetattr");
        return false;
    }

    ::cfmakeraw(&tty);

    // 8N1, receiver on, ignore modem control lines, no hardware flow control
    tty.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
    tty.c_cflag |= CS8 | CREAD | CLOCAL;
    tty.c_iflag &= ~(IXON | IXOFF | IXANY);

    // Pure non-blocking reads, timing is done with poll()
    tty.c_cc[VMIN] = 0;
    tty.c_cc[VTIME] = 0;

    ::cfsetispeed(&tty, speed);
    ::cfsetospeed(&tty, speed);

    if (::tcsetattr(fd_, TCSANOW, &tty) < 0) {
        std::perror("tcsetattr");
        return false;
    }
    return true;
}

void SerialPort::write(const uint8_t* data, size_t len) {
    if (fd_ < 0) throw TransportError("write", EBADF);

    double deadline = clock_monotonic() + timeout_sec_;
    size_t sent = 0;

    while (sent < len) {
        double remaining = deadline - clock_monotonic();
        if (remaining <= 0) throw TransportTimeout(len, sent);

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLOUT;

        int timeout_ms = static_cast<int>(remaining * 1000);
        if (timeout_ms < 1) timeout_ms = 1;

        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError("poll", errno);
        }
        if (ret == 0) throw TransportTimeout(len, sent);
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            throw TransportError("write", EIO);
        }

        ssize_t n = ::write(fd_, data + sent, len - sent);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            throw TransportError("write", errno);
        }
        sent += static_cast<size_t>(n);
    }
}

size_t SerialPort::read(uint8_t* buf, size_t len) {
    if (fd_ < 0) throw TransportError("read", EBADF);

    double deadline = clock_monotonic() + timeout_sec_;
    size_t got = 0;

    while (got < len) {
        double remaining = deadline - clock_monotonic();
        if (remaining <= 0) break;

        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int timeout_ms = static_cast<int>(remaining * 1000);
        if (timeout_ms < 1) timeout_ms = 1;

        int ret = ::poll(&pfd, 1, timeout_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError("poll", errno);
        }
        if (ret == 0) break;  // timeout
        if (pfd.revents & (POLLERR | POLLNVAL)) {
            throw TransportError("read", EIO);
        }

        ssize_t n = ::read(fd_, buf + got, len - got);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
            throw TransportError("read", errno);
        }
        if (n == 0) {
            // POLLHUP with nothing left: cable unplugged / Bluetooth link lost
            if (pfd.revents & POLLHUP) throw TransportError("read", EIO);
            continue;
        }
        got += static_cast<size_t>(n);
    }

    return got;
}

void SerialPort::reset_input_buffer() {
    if (fd_ < 0) throw TransportError("tcflush", EBADF);
    if (::tcflush(fd_, TCIFLUSH) < 0) {
        throw TransportError("tcflush", errno);
    }
}

} // namespace aqwave
