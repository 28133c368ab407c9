#include "streaming/server.hpp"
#include "streaming/protocol.hpp"

#include <cstdio>
#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <time.h>
#include <unistd.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <lz4frame.h>

namespace aqwave {

namespace {

constexpr size_t FRAME_HEADER_SIZE = 8;
constexpr double ALIVE_CHECK_SEC = 1.0;

double clock_monotonic() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ts.tv_sec + ts.tv_nsec * 1e-9;
}

void nap_ms(long ms) {
    struct timespec ts{0, ms * 1'000'000};
    nanosleep(&ts, nullptr);
}

// Bound, listening socket or -1
int open_listener(const char* host, int port) {
    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (std::strcmp(host, "0.0.0.0") == 0) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, host, &addr.sin_addr) != 1) {
        std::fprintf(stderr, "  [STREAM] Invalid listen address '%s'\n", host);
        return -1;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        std::fprintf(stderr, "  [STREAM] socket() failed: %s\n", strerror(errno));
        return -1;
    }

    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::fprintf(stderr, "  [STREAM] bind(%s:%d) failed: %s\n", host, port, strerror(errno));
        ::close(fd);
        return -1;
    }
    if (::listen(fd, LISTEN_BACKLOG) < 0) {
        std::fprintf(stderr, "  [STREAM] listen() failed: %s\n", strerror(errno));
        ::close(fd);
        return -1;
    }
    return fd;
}

// Non-blocking, no Nagle, dead peers noticed within ~25 s
void tune_client_socket(int fd) {
    int one = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

    const int idle = 10, intvl = 5, cnt = 3;
    setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
    setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
}

} // namespace

StreamingServer::StreamingServer(const DeviceInfo& info)
    : stop_flag_(false)
    , pending_client_fd_(-1)
    , listen_fd_(-1)
    , bound_port_(0)
    , client_fd_(-1)
    , batch_count_(0)
    , last_flush_time_(0)
    , last_alive_check_(0)
    , sample_number_(0)
    , frame_cap_(0)
    , lz4_ctx_(nullptr)
    , metadata_len_(0)
    , samples_sent_(0)
    , batches_sent_(0)
    , stream_drops_(0)
    , reconnects_(0)
    , connected_(false)
{
    std::memset(batch_buf_, 0, sizeof(batch_buf_));

    metadata_len_ = build_metadata_json(metadata_buf_, sizeof(metadata_buf_), info);
    if (metadata_len_ < 0) {
        metadata_len_ = 0;
    } else if (metadata_len_ >= static_cast<int>(sizeof(metadata_buf_))) {
        metadata_len_ = static_cast<int>(sizeof(metadata_buf_)) - 1;
    }

    LZ4F_errorCode_t err = LZ4F_createCompressionContext(&lz4_ctx_, LZ4F_VERSION);
    if (LZ4F_isError(err)) {
        std::fprintf(stderr, "  [STREAM] LZ4 context creation failed: %s\n",
                     LZ4F_getErrorName(err));
        lz4_ctx_ = nullptr;
        return;
    }

    frame_cap_ = FRAME_HEADER_SIZE + LZ4F_compressFrameBound(sizeof(batch_buf_), nullptr);
    frame_buf_ = std::make_unique<uint8_t[]>(frame_cap_);
}

StreamingServer::~StreamingServer() {
    stop();
    if (lz4_ctx_) {
        LZ4F_freeCompressionContext(lz4_ctx_);
    }
}

bool StreamingServer::start(const char* host, int port) {
    if (!lz4_ctx_) return false;

    listen_fd_ = open_listener(host, port);
    if (listen_fd_ < 0) return false;

    struct sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) < 0) {
        std::fprintf(stderr, "  [STREAM] getsockname() failed: %s\n", strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    bound_port_ = ntohs(bound.sin_port);

    std::printf("  [STREAM] Listening on %s:%d\n", host, bound_port_);

    stop_flag_.store(false, std::memory_order_relaxed);
    accept_thread_ = std::thread(&StreamingServer::accept_loop, this);
    stream_thread_ = std::thread(&StreamingServer::stream_loop, this);
    return true;
}

void StreamingServer::stop() {
    stop_flag_.store(true, std::memory_order_relaxed);

    if (accept_thread_.joinable()) accept_thread_.join();
    if (stream_thread_.joinable()) stream_thread_.join();

    // Only after the join: accept_loop polls listen_fd_
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }
    int pending = pending_client_fd_.exchange(-1);
    if (pending >= 0) {
        ::close(pending);
    }
}

StreamingServer::Stats StreamingServer::get_stats() const {
    Stats s{};
    s.samples_sent = samples_sent_.load(std::memory_order_relaxed);
    s.batches_sent = batches_sent_.load(std::memory_order_relaxed);
    s.drops = stream_drops_.load(std::memory_order_relaxed);
    s.reconnects = reconnects_.load(std::memory_order_relaxed);
    s.ring_queued = ring_.size_approx();
    s.connected = connected_.load(std::memory_order_relaxed);
    return s;
}

void StreamingServer::accept_loop() {
    struct pollfd pfd{};
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load(std::memory_order_relaxed)) {
        // 1s timeout so stop_flag_ is seen
        pfd.revents = 0;
        if (poll(&pfd, 1, 1000) <= 0) continue;
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) break;

        struct sockaddr_in peer{};
        socklen_t peer_len = sizeof(peer);
        int fd = ::accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&peer), &peer_len);
        if (fd < 0) continue;

        tune_client_socket(fd);

        char peer_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &peer.sin_addr, peer_str, sizeof(peer_str));
        std::printf("  [STREAM] Client connected: %s:%d\n", peer_str, ntohs(peer.sin_port));

        // A client nobody picked up yet is replaced
        int unclaimed = pending_client_fd_.exchange(fd, std::memory_order_release);
        if (unclaimed >= 0) {
            ::close(unclaimed);
        }
    }
}

void StreamingServer::drop_client(const char* reason) {
    std::printf("  [STREAM] Client disconnected (%s)\n", reason);
    ::close(client_fd_);
    client_fd_ = -1;
    batch_count_ = 0;
    connected_.store(false, std::memory_order_relaxed);
}

void StreamingServer::adopt_pending_client() {
    int fd = pending_client_fd_.exchange(-1, std::memory_order_acquire);
    if (fd < 0) return;

    if (client_fd_ >= 0) {
        ::close(client_fd_);
    }
    client_fd_ = fd;

    // A fresh client starts from live data
    DataSample stale;
    while (ring_.try_pop(stale)) {}

    if (!send_all(client_fd_, reinterpret_cast<const uint8_t*>(metadata_buf_),
                  static_cast<size_t>(metadata_len_), SEND_TIMEOUT_SEC)) {
        drop_client("metadata send failed");
        return;
    }

    batch_count_ = 0;
    sample_number_ = 0;
    last_flush_time_ = clock_monotonic();
    last_alive_check_ = last_flush_time_;
    connected_.store(true, std::memory_order_relaxed);
    reconnects_.fetch_add(1, std::memory_order_relaxed);
    std::printf("  [STREAM] Metadata sent, streaming...\n");
}

bool StreamingServer::client_alive(double now) {
    if (now - last_alive_check_ < ALIVE_CHECK_SEC) return true;
    last_alive_check_ = now;

    char peek;
    ssize_t r = ::recv(client_fd_, &peek, 1, MSG_DONTWAIT | MSG_PEEK);
    if (r == 0) {
        drop_client("FIN");
        return false;
    }
    if (r < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
        drop_client(strerror(errno));
        return false;
    }
    return true;
}

bool StreamingServer::send_batch(int batch_count) {
    const size_t raw_bytes = static_cast<size_t>(batch_count) * WIRE_SAMPLE_SIZE;
    uint8_t* dst = frame_buf_.get() + FRAME_HEADER_SIZE;
    size_t cap = frame_cap_ - FRAME_HEADER_SIZE;
    size_t used = 0;

    // begin / update / end, each step appending to dst
    size_t n = LZ4F_compressBegin(lz4_ctx_, dst, cap, nullptr);
    if (!LZ4F_isError(n)) {
        used += n;
        n = LZ4F_compressUpdate(lz4_ctx_, dst + used, cap - used, batch_buf_, raw_bytes, nullptr);
    }
    if (!LZ4F_isError(n)) {
        used += n;
        n = LZ4F_compressEnd(lz4_ctx_, dst + used, cap - used, nullptr);
    }
    if (LZ4F_isError(n)) {
        // Batch lost, the connection itself is fine
        std::fprintf(stderr, "  [STREAM] LZ4 compression error: %s\n", LZ4F_getErrorName(n));
        return true;
    }
    used += n;

    const uint32_t header[2] = {static_cast<uint32_t>(used), static_cast<uint32_t>(batch_count)};
    std::memcpy(frame_buf_.get(), header, sizeof(header));

    if (!send_all(client_fd_, frame_buf_.get(), FRAME_HEADER_SIZE + used, SEND_TIMEOUT_SEC)) {
        return false;
    }

    samples_sent_.fetch_add(static_cast<uint64_t>(batch_count), std::memory_order_relaxed);
    batches_sent_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void StreamingServer::stream_loop() {
    DataSample sample;

    while (!stop_flag_.load(std::memory_order_relaxed)) {
        adopt_pending_client();

        if (client_fd_ < 0) {
            // Nobody listening: discard
            while (ring_.try_pop(sample)) {}
            nap_ms(10);
            continue;
        }

        double now = clock_monotonic();
        if (!client_alive(now)) continue;

        const bool got = ring_.try_pop(sample);
        if (got) {
            pack_sample(batch_buf_ + static_cast<size_t>(batch_count_) * WIRE_SAMPLE_SIZE,
                        sample, sample_number_++);
            ++batch_count_;
        }

        now = clock_monotonic();
        const bool full = batch_count_ >= BATCH_SIZE;
        const bool stale = batch_count_ > 0 &&
                           (now - last_flush_time_) * 1000.0 >= FLUSH_TIMEOUT_MS;
        if (full || stale) {
            if (!send_batch(batch_count_)) {
                drop_client("send failed");
                continue;
            }
            batch_count_ = 0;
            last_flush_time_ = now;
        }

        if (!got && batch_count_ == 0) {
            nap_ms(5);  // one sample every ~16 ms
        }
    }

    if (client_fd_ >= 0) {
        ::close(client_fd_);
        client_fd_ = -1;
    }
    connected_.store(false, std::memory_order_relaxed);
}

} // namespace aqwave
