#include "streaming/protocol.hpp"

#include <cstdio>
#include <cstring>
#include <string>
#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <time.h>

namespace aqwave {

size_t pack_sample(uint8_t* dst, const DataSample& s, uint32_t sample_number) {
    size_t off = 0;

    std::memcpy(dst + off, &s.timestamp, 8);
    off += 8;

    std::memcpy(dst + off, &sample_number, 4);
    off += 4;

    const int32_t fields[WIRE_FIELDS] = {
        static_cast<int32_t>(s.pulse),
        static_cast<int32_t>(s.ppg),
        static_cast<int32_t>(s.ppg_alt),
        static_cast<int32_t>(s.heart_rate),
        static_cast<int32_t>(s.spo2),
    };
    std::memcpy(dst + off, fields, sizeof(fields));
    off += sizeof(fields);

    return off;
}

// Device strings come off the wire; keep them JSON-safe
static void copy_json_safe(char* dst, size_t cap, const std::string& src) {
    size_t o = 0;
    for (char c : src) {
        if (o + 1 >= cap) break;
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u >= 0x7F || c == '"' || c == '\\') continue;
        dst[o++] = c;
    }
    dst[o] = '\0';
}

int build_metadata_json(char* buf, size_t cap, const DeviceInfo& info) {
    char device[64];
    char product[64];
    char manufacturer[64];
    copy_json_safe(device, sizeof(device), info.device);
    copy_json_safe(product, sizeof(product), info.product);
    copy_json_safe(manufacturer, sizeof(manufacturer), info.manufacturer);

    return std::snprintf(buf, cap,
        "{\"format\":\"binary_lz4\",\"batch_size\":%d,\"sample_rate\":%d,"
        "\"device\":\"%s\",\"product\":\"%s\",\"manufacturer\":\"%s\","
        "\"fields\":[\"pulse\",\"ppg\",\"ppg_alt\",\"heart_rate\",\"spo2\"],"
        "\"sample_size\":%zu,\"sample_struct\":\"<dI%di\"}\n",
        BATCH_SIZE, STREAM_RATE_HZ,
        device, product, manufacturer,
        WIRE_SAMPLE_SIZE, WIRE_FIELDS);
}

static double clock_monotonic() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec * 1e-9;
}

bool send_all(int fd, const uint8_t* data, size_t len, double timeout_sec) {
    double deadline = clock_monotonic() + timeout_sec;
    size_t sent = 0;

    while (sent < len) {
        double remaining = deadline - clock_monotonic();
        if (remaining <= 0) return false;

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int timeout_ms = static_cast<int>(remaining * 1000);
        if (timeout_ms < 1) timeout_ms = 1;

        int ret = poll(&pfd, 1, timeout_ms);
        if (ret <= 0) return false;
        if (pfd.revents & (POLLERR | POLLHUP)) return false;

        ssize_t n = ::send(fd, data + sent, len - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }

    return true;
}

} // namespace aqwave
